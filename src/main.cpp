#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/worker_pool.hpp"
#include "config.hpp"
#include "judge/dispatcher.hpp"
#include "judge/request.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codejudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("request", po::value<string>(), "read the execution request from the given file instead of stdin")
        ("docker", po::value<string>(), "set the path of docker client, default to docker. You can either pass it from environ DOCKER")
        ("run-dir", po::value<string>(), "set the directory to create workspaces in, default to system temporary directory. You can either pass it from environ RUNDIR")
        ("problem-dir", po::value<string>(), "set the directory with test cases of problems stored as [problem_id].json. You can either pass it from environ PROBLEMDIR")
        ("languages", po::value<string>(), "load extra language profiles from the given json file. You can either pass it from environ LANGUAGES")
        ("workers", po::value<size_t>(), "set the maximum number of sandboxes running at the same time, default to the number of cores. You can either pass it from environ WORKERS")
        ("pids-limit", po::value<int>(), "set the maximum number of processes in a sandbox, default to 100")
        ("output-limit", po::value<size_t>(), "set the maximum bytes of stdout and stderr collected from a sandbox, default to 1048576(1MB)")
        ("kill-grace", po::value<int>(), "set the milliseconds to wait for a sandbox after killing it, default to 1000")
        ("default-timeout", po::value<int>(), "set the time limit in milliseconds for requests without one, default to 5000")
        ("default-memory", po::value<int>(), "set the memory limit in MB for requests without one, default to 128")
        ("default-cpu-shares", po::value<int>(), "set the cpu shares for requests without one, default to 512")
        ("aggregation", po::value<string>(), "set how the overall status is decided, first_failure(default) or most_severe")
        ("debug", "turn on the debug mode to keep workspaces for checking the written source code and input data.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codejudge: Execute a submission against its test cases in docker sandboxes" << endl
             << "Reads an execution request in json and writes the execution result in json to stdout" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codejudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    codejudge::configuration config;

    try {
        if (vm.count("debug")) {
            config.debug = true;
        } else if (getenv("DEBUG")) {
            config.debug = true;
        }

        if (vm.count("docker")) {
            config.docker = vm.at("docker").as<string>();
        } else if (getenv("DOCKER")) {
            config.docker = getenv("DOCKER");
        }

        if (vm.count("run-dir")) {
            config.run_dir = filesystem::path(vm.at("run-dir").as<string>());
        } else if (getenv("RUNDIR")) {
            config.run_dir = filesystem::path(getenv("RUNDIR"));
        }
        CHECK(filesystem::is_directory(config.run_dir))
            << "Run directory " << config.run_dir << " does not exist";

        if (vm.count("problem-dir")) {
            config.problem_dir = filesystem::path(vm.at("problem-dir").as<string>());
        } else if (getenv("PROBLEMDIR")) {
            config.problem_dir = filesystem::path(getenv("PROBLEMDIR"));
        }
        if (!config.problem_dir.empty())
            CHECK(filesystem::is_directory(config.problem_dir))
                << "Problem directory " << config.problem_dir << " does not exist";

        if (vm.count("languages")) {
            config.languages_file = filesystem::path(vm.at("languages").as<string>());
        } else if (getenv("LANGUAGES")) {
            config.languages_file = filesystem::path(getenv("LANGUAGES"));
        }

        if (vm.count("workers")) {
            config.workers = vm["workers"].as<size_t>();
        } else if (getenv("WORKERS")) {
            config.workers = boost::lexical_cast<size_t>(getenv("WORKERS"));
        }
        CHECK(config.workers > 0) << "Number of workers should be positive";

        if (vm.count("pids-limit")) config.pids_limit = vm["pids-limit"].as<int>();
        if (vm.count("output-limit")) config.output_limit = vm["output-limit"].as<size_t>();
        if (vm.count("kill-grace")) config.kill_grace_ms = vm["kill-grace"].as<int>();
        if (vm.count("default-timeout")) config.default_timeout_ms = vm["default-timeout"].as<int>();
        if (vm.count("default-memory")) config.default_memory_mb = vm["default-memory"].as<int>();
        if (vm.count("default-cpu-shares")) config.default_cpu_shares = vm["default-cpu-shares"].as<int>();
        if (vm.count("aggregation"))
            config.aggregation = codejudge::parse_aggregation_policy(vm["aggregation"].as<string>());
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Malformed environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (codejudge::configuration_error& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    codejudge::language_registry languages;
    if (!config.languages_file.empty()) {
        try {
            languages.load(config.languages_file);
        } catch (codejudge::configuration_error& e) {
            LOG(ERROR) << "Unable to load language profiles: " << e;
            return EXIT_FAILURE;
        }
    }

    unique_ptr<codejudge::server::test_case_fetcher> fetcher;
    if (!config.problem_dir.empty())
        fetcher = make_unique<codejudge::server::local_test_case_fetcher>(config.problem_dir);

    codejudge::docker_runtime runtime(config.docker, config.pids_limit);
    codejudge::worker_pool pool(config.workers);
    codejudge::dispatcher dispatcher(config, languages, runtime, pool, fetcher.get());

    string content;
    if (vm.count("request")) {
        filesystem::path request_file(vm["request"].as<string>());
        if (!filesystem::is_regular_file(request_file)) {
            cerr << "Request file " << request_file << " does not exist" << endl;
            return EXIT_FAILURE;
        }
        content = codejudge::read_file_content(request_file);
    } else {
        content.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    }

    codejudge::execution_request request;
    try {
        nlohmann::json::parse(content).get_to(request);
    } catch (nlohmann::json::exception& e) {
        cerr << "Invalid JSON format: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    try {
        cout << codejudge::dump_result(dispatcher.execute(request)) << endl;
    } catch (std::exception& e) {
        LOG(ERROR) << "Unable to execute request: " << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
