#include "judge/sandbox.hpp"
#include <glog/logging.h>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace codejudge {
using namespace std;

sandbox_runner::sandbox_runner(const configuration &config, const container_runtime &runtime)
    : config(config), runtime(runtime) {}

execution_outcome sandbox_runner::run(const string &source,
                                      const language_profile &profile,
                                      const string &input,
                                      const resource_limits &limits) const {
    // 工作目录在函数返回或抛出异常时删除
    scoped_workspace workspace;
    try {
        workspace = make_workspace(config.run_dir, "code-execution", config.debug);
        write_file_content(workspace.path() / assert_safe_path(profile.source), source);
        if (!input.empty())
            write_file_content(workspace.path() / STDIN_FILE, input);
    } catch (std::exception &ex) {
        throw internal_error(string("Unable to prepare workspace: ") + ex.what());
    }

    // 工作目录名包含 uuid，同时作为容器名
    string name = workspace.path().filename().string();
    vector<string> program = profile.render(runtime.mount_point(workspace.path()), !input.empty());
    vector<string> argv = runtime.command(workspace.path(), profile, limits, name, program);

    process_options options;
    options.timeout = chrono::milliseconds(limits.timeout_ms);
    options.output_limit = config.output_limit;
    options.kill_grace = chrono::milliseconds(config.kill_grace_ms);
    options.on_timeout = [&]() { runtime.terminate(name); };

    process_result result;
    try {
        result = call_process(options, argv);
    } catch (std::system_error &ex) {
        throw internal_error(string("Unable to start sandbox: ") + ex.what());
    }

    if (result.timed_out)
        LOG(WARNING) << "Sandbox " << name << " exceeded time limit " << limits.timeout_ms << "ms, killed";
    else if (runtime.failure_exitcode() >= 0 && result.exitcode == runtime.failure_exitcode())
        throw internal_error("Unable to start sandbox " + name + ": " + result.err);

    execution_outcome outcome;
    outcome.out = move(result.out);
    outcome.err = move(result.err);
    outcome.timed_out = result.timed_out;
    outcome.exitcode = result.exitcode;
    outcome.signal = result.signal;
    outcome.exited_normally = !result.timed_out && result.exitcode == 0;
    outcome.elapsed_ms = result.elapsed.count();
    return outcome;
}

}  // namespace codejudge
