#include <glog/logging.h>
#include <sys/stat.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <iterator>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "monitor/monitor.hpp"
#include "workspace/workspace_store.hpp"
using namespace std;
using namespace nlohmann;

/**
 * @brief 命令行中给出的一个运行请求
 */
struct request_task {
    size_t index;
    string source;  // 请求文件路径，"-" 表示标准输入
    string content;
};

static json error_json(const string &kind, const string &message) {
    return {{"error", kind}, {"message", message}};
}

static json run_one(runner::run_engine &engine, const request_task &task) {
    runner::run_request request;
    try {
        request = json::parse(task.content).get<runner::run_request>();
    } catch (json::exception &ex) {
        LOG(WARNING) << "Malformed request " << task.source << ": " << ex.what();
        return error_json("invalid_request", ex.what());
    }

    try {
        return engine.run(request);
    } catch (runner::runner_exception &ex) {
        return error_json(ex.kind(), ex.what());
    }
}

/**
 * @brief 启动 worker 线程，不断从请求队列中取出请求执行，直到队列为空
 * 所有请求在 worker 启动之前就已经全部入队，因此队列为空即可退出
 */
static thread start_worker(size_t worker_id, runner::run_engine &engine,
                           runner::concurrent_queue<request_task> &queue, vector<json> &results) {
    return thread([worker_id, &engine, &queue, &results] {
        request_task task;
        while (queue.try_pop(task)) {
            DLOG(INFO) << "Worker " << worker_id << " running request " << task.source;
            results[task.index] = run_one(engine, task);
        }
    });
}

static int run_workspace_command(runner::workspace_store &store, const boost::program_options::variables_map &vm) {
    if (vm.count("create-workspace")) {
        cout << store.create() << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("workspace")) {
        cerr << "--workspace is required" << endl;
        return EXIT_FAILURE;
    }
    string id = vm.at("workspace").as<string>();

    if (vm.count("list")) {
        json files = store.list(id);
        cout << files.dump() << endl;
    } else if (vm.count("read")) {
        cout << store.read(id, vm.at("read").as<string>());
    } else if (vm.count("write")) {
        string content((istreambuf_iterator<char>(cin)), istreambuf_iterator<char>());
        store.write(id, vm.at("write").as<string>(), content);
    } else if (vm.count("delete")) {
        store.remove(id, vm.at("delete").as<string>());
    } else {
        cerr << "One of --list, --read, --write, --delete is required" << endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("code-runner options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load engine configuration from the given JSON file")
        ("run-dir", po::value<string>(), "set the directory to create run directories in. You can either pass it from environ RUNDIR")
        ("workspace-dir", po::value<string>(), "set the directory to store workspaces in. You can either pass it from environ WORKSPACEDIR")
        ("docker", po::value<string>(), "set the docker executable. You can either pass it from environ DOCKER")
        ("max-runs", po::value<size_t>(), "set the maximum number of concurrently running sandboxes, default to the number of cores. You can either pass it from environ MAXRUNS")
        ("watchdog-margin", po::value<int>(), "set the seconds the host watchdog waits beyond the time limit, default to 10")
        ("stream-limit", po::value<size_t>(), "set the maximum bytes kept from stdout and stderr, default to 4MB")
        ("request", po::value<vector<string>>(), "run the JSON run request in the given file, - for stdin. Can be given multiple times")
        ("create-workspace", "create a workspace with hello world files and print its id")
        ("workspace", po::value<string>(), "workspace id for --list, --read, --write, --delete")
        ("list", "list files in the workspace")
        ("read", po::value<string>(), "print the content of a file in the workspace")
        ("write", po::value<string>(), "write stdin to a file in the workspace")
        ("delete", po::value<string>(), "delete a file in the workspace")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    pos.add("request", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "code-runner: run source code in isolated sandboxes" << endl
             << "Each request is a JSON object: {workspaceId, files: [{name, content}], language, stdin, timeLimit, memory, cpus}" << endl
             << "Results are printed as one JSON object per line, in request order" << endl
             << "Usage: " << argv[0] << " [options] [request files]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-runner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    runner::runner_config config;
    config.run_dir = filesystem::temp_directory_path() / "code-runner" / "runs";
    config.workspace_dir = filesystem::temp_directory_path() / "code-runner" / "workspaces";

    if (vm.count("config")) {
        string path = vm.at("config").as<string>();
        CHECK(filesystem::is_regular_file(path))
            << "Configuration file " << path << " does not exist";
        try {
            runner::load_config(path, config);
        } catch (std::exception &e) {
            LOG(FATAL) << "Configuration file " << path << " is malformed: " << e.what();
        }
    }

    if (vm.count("run-dir")) {
        config.run_dir = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        config.run_dir = filesystem::path(getenv("RUNDIR"));
    }
    filesystem::create_directories(config.run_dir);
    CHECK(filesystem::is_directory(config.run_dir))
        << "Run directory " << config.run_dir << " does not exist";

    if (vm.count("workspace-dir")) {
        config.workspace_dir = filesystem::path(vm.at("workspace-dir").as<string>());
    } else if (getenv("WORKSPACEDIR")) {
        config.workspace_dir = filesystem::path(getenv("WORKSPACEDIR"));
    }
    filesystem::create_directories(config.workspace_dir);
    CHECK(filesystem::is_directory(config.workspace_dir))
        << "Workspace directory " << config.workspace_dir << " does not exist";

    if (vm.count("docker")) {
        config.docker = vm.at("docker").as<string>();
    } else if (getenv("DOCKER")) {
        config.docker = getenv("DOCKER");
    }

    if (vm.count("max-runs")) {
        config.max_concurrent_runs = vm.at("max-runs").as<size_t>();
    } else if (getenv("MAXRUNS")) {
        config.max_concurrent_runs = boost::lexical_cast<size_t>(getenv("MAXRUNS"));
    }

    if (vm.count("watchdog-margin"))
        config.watchdog_margin = vm.at("watchdog-margin").as<int>();
    CHECK(config.watchdog_margin >= 0) << "Watchdog margin must not be negative";

    if (vm.count("stream-limit"))
        config.stream_limit = vm.at("stream-limit").as<size_t>();

    // 让运行目录中的文件只允许当前用户写入
    umask(0022);

    runner::local_workspace_store store(config.workspace_dir);

    if (vm.count("create-workspace") || vm.count("workspace")) {
        try {
            return run_workspace_command(store, vm);
        } catch (std::exception &e) {
            LOG(ERROR) << boost::diagnostic_information(e);
            cerr << e.what() << endl;
            return EXIT_FAILURE;
        }
    }

    if (!vm.count("request")) {
        cerr << "No run request given" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    runner::counting_monitor counters;
    runner::run_engine engine(config, store, make_unique<runner::docker_sandbox>(config.docker), &counters);

    runner::concurrent_queue<request_task> queue;
    auto sources = vm.at("request").as<vector<string>>();
    for (size_t i = 0; i < sources.size(); ++i) {
        request_task task{i, sources[i], ""};
        if (task.source == "-") {
            task.content.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
        } else {
            try {
                task.content = runner::read_file_content(task.source);
            } catch (std::system_error &e) {
                LOG(FATAL) << "Unable to read request file " << task.source << ": " << e.what();
            }
        }
        queue.push(move(task));
    }

    vector<json> results(sources.size());
    vector<thread> worker_threads;
    size_t workers = min(sources.size(), runner::effective_concurrency(config));
    for (size_t i = 0; i < workers; ++i)
        worker_threads.push_back(start_worker(i, engine, queue, results));

    for (auto &th : worker_threads)
        th.join();

    // 程序输出不一定是合法的 UTF-8
    bool failed = false;
    for (auto &result : results) {
        cout << result.dump(-1, ' ', false, json::error_handler_t::replace) << endl;
        if (result.count("error")) failed = true;
    }

    LOG(INFO) << counters.runs_finished.load() << " runs finished, " << counters.runs_failed.load() << " failed, "
              << counters.build_failures.load() << " build failures, " << counters.timeouts.load() << " timeouts, "
              << counters.host_errors.load() << " host errors";

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
