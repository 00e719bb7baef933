#include "common/io_utils.hpp"
#include <errno.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <system_error>

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    fout << content;
    fout.flush();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath.find("/..") != string::npos || subpath == "..")
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

scoped_workspace::scoped_workspace() : valid(false), keep(false) {}

scoped_workspace::scoped_workspace(const fs::path &dir, bool keep)
    : dir(dir), valid(true), keep(keep) {}

scoped_workspace::scoped_workspace(scoped_workspace &&workspace)
    : valid(false), keep(false) {
    *this = move(workspace);
}

scoped_workspace::~scoped_workspace() {
    release();
}

scoped_workspace &scoped_workspace::operator=(scoped_workspace &&workspace) {
    swap(dir, workspace.dir);
    swap(valid, workspace.valid);
    swap(keep, workspace.keep);
    return *this;
}

const fs::path &scoped_workspace::path() const {
    return dir;
}

void scoped_workspace::release() {
    if (!valid) return;
    valid = false;
    if (keep) return;

    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG(ERROR) << "Unable to delete directory " << dir << ": " << ec.message();
}

scoped_workspace make_workspace(const fs::path &parent, const string &prefix, bool keep) {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path dir = parent / (prefix + "-" + uuid);
    fs::create_directories(parent);
    if (!fs::create_directory(dir))
        throw fs::filesystem_error("workspace already exists", dir, make_error_code(errc::file_exists));
    // 容器内的进程没有 CAP_DAC_OVERRIDE，需要放开权限才能在工作目录中写入编译产物
    fs::permissions(dir, fs::perms::all);
    return scoped_workspace(dir, keep);
}

}  // namespace codejudge
