#include "judge/runtime.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/stl_utils.hpp"
#include "common/utils.hpp"

namespace codejudge {
using namespace std;

// 工作目录在容器内的挂载点
static const char *CONTAINER_WORKDIR = "/app";

// docker run 自身出错（而不是容器中的命令出错）时的返回值
static const int DOCKER_FAILURE_EXITCODE = 125;

container_runtime::~container_runtime() {}

int container_runtime::failure_exitcode() const {
    return -1;
}

docker_runtime::docker_runtime(const string &docker, int pids_limit)
    : docker(docker), pids_limit(pids_limit) {}

string docker_runtime::mount_point(const filesystem::path &) const {
    return CONTAINER_WORKDIR;
}

vector<string> docker_runtime::command(const filesystem::path &workspace,
                                       const language_profile &profile,
                                       const resource_limits &limits,
                                       const string &name,
                                       const vector<string> &program) const {
    // clang-format off
    vector<string> argv = {
        docker, "run", "--rm",
        "--name", name,
        "--network=none",
        fmt::format("--memory={}m", limits.memory_mb),
        fmt::format("--memory-swap={}m", limits.memory_mb),  // 和内存限制相同，不允许使用 swap
        fmt::format("--cpu-shares={}", limits.cpu_shares),
        fmt::format("--pids-limit={}", pids_limit),
        "--security-opt=no-new-privileges",
        "--cap-drop=ALL",
        "-v", fmt::format("{}:{}", workspace.string(), CONTAINER_WORKDIR),
        profile.image
    };
    // clang-format on
    append(argv, program);
    return argv;
}

void docker_runtime::terminate(const string &name) const {
    process_options options;
    options.timeout = chrono::seconds(10);
    try {
        auto result = call_process(options, docker, "kill", name);
        // 容器可能已经自行退出并被 --rm 删除，此时 docker kill 失败是正常的
        if (result.exitcode != 0)
            DLOG(INFO) << "docker kill " << name << " exited with " << result.exitcode << ": " << result.err;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to kill container " << name << ": " << ex.what();
    }
}

int docker_runtime::failure_exitcode() const {
    return DOCKER_FAILURE_EXITCODE;
}

}  // namespace codejudge
