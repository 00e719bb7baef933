#include "judge/language.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

const char *STDIN_FILE = "input.txt";

// 不支持的语言使用的镜像，只需要能运行 sh
static const char *FALLBACK_IMAGE = "alpine:latest";

// clang-format off
static const vector<language_profile> builtin_profiles = {
    {"python", "main.py", "python:3.12.10-alpine",
     "python {dir}/{source} {stdin}", language_family::INTERPRETED},
    {"java", "Main.java", "openjdk:17-jdk-slim",
     "javac {dir}/{source} && java -classpath {dir} Main {stdin}", language_family::COMPILED},
    {"cpp", "main.cpp", "gcc:latest",
     "g++ -o {dir}/a.out {dir}/{source} && {dir}/a.out {stdin}", language_family::COMPILED},
    {"go", "main.go", "golang:1.22-alpine",
     "go run {dir}/{source} {stdin}", language_family::COMPILED},
    {"javascript", "index.js", "node:22.16.0-alpine",
     "node {dir}/{source} {stdin}", language_family::INTERPRETED},
};
// clang-format on

vector<string> language_profile::render(const string &dir, bool has_stdin) const {
    if (!supported) {
        // 语言 id 作为参数传给 sh，避免拼接进命令导致注入
        return {"sh", "-c", "echo \"Unsupported language: $1\" >&2; exit 1", "sh", id};
    }

    string redirect = has_stdin ? fmt::format("< {}/{}", dir, STDIN_FILE) : "";
    return {"sh", "-c",
            fmt::format(fmt::runtime(command),
                        fmt::arg("dir", dir),
                        fmt::arg("source", source),
                        fmt::arg("stdin", redirect))};
}

void from_json(const json &j, language_profile &profile) {
    j.at("id").get_to(profile.id);
    j.at("source").get_to(profile.source);
    j.at("image").get_to(profile.image);
    j.at("command").get_to(profile.command);
    profile.family = j.value("compiled", false) ? language_family::COMPILED : language_family::INTERPRETED;
    profile.supported = true;
}

language_registry::language_registry() {
    for (auto &profile : builtin_profiles)
        add(profile);
}

void language_registry::add(const language_profile &profile) {
    if (profile.id.empty())
        throw configuration_error("Language id should not be empty");

    try {
        assert_safe_path(profile.source);
        profile.render("/app", true);  // 提前检查命令模板中的占位符
    } catch (fmt::format_error &ex) {
        throw configuration_error("Malformed command template of language " + profile.id + ": " + ex.what());
    } catch (std::runtime_error &ex) {
        throw configuration_error("Malformed source file name of language " + profile.id + ": " + ex.what());
    }

    profiles[profile.id] = profile;
}

void language_registry::load(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw configuration_error("Unable to find language configuration file " + path.string());

    vector<language_profile> loaded;
    try {
        json j = json::parse(read_file_content(path));
        j.get_to(loaded);
    } catch (json::exception &ex) {
        throw configuration_error("Language configuration file " + path.string() + " is malformed: " + ex.what());
    }

    for (auto &profile : loaded) {
        LOG(INFO) << "Registering language " << profile.id << " with image " << profile.image;
        add(profile);
    }
}

language_profile language_registry::resolve(const string &language) const {
    auto it = profiles.find(language);
    if (it != profiles.end()) return it->second;

    language_profile profile;
    profile.id = language;
    profile.source = "main.txt";
    profile.image = FALLBACK_IMAGE;
    profile.family = language_family::INTERPRETED;
    profile.supported = false;
    return profile;
}

bool language_registry::contains(const string &language) const {
    return profiles.count(language);
}

vector<string> language_registry::languages() const {
    vector<string> result;
    for (auto &[id, profile] : profiles)
        result.push_back(id);
    return result;
}

}  // namespace codejudge
