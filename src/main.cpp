#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "contest/leaderboard.hpp"
#include "contest/schedule.hpp"
#include "executor/judge0.hpp"
#include "judge/orchestrator.hpp"
#include "server/mysql/store.hpp"
#include "worker.hpp"
using namespace std;
using namespace nlohmann;

static volatile sig_atomic_t interrupted = 0;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, stopping workers";
    interrupted = 1;
    arbiter::stop_workers();
}

/**
 * @brief 命令行参数优先，其次是环境变量
 */
template <typename T>
static bool read_option(const boost::program_options::variables_map &vm, const char *option, const char *env, T &value) {
    if (vm.count(option)) {
        value = vm.at(option).as<T>();
        return true;
    } else if (string literal = get_env(env, ""); !literal.empty()) {
        value = boost::lexical_cast<T>(literal);
        return true;
    }
    return false;
}

static string dump(const json &j) {
    // 选手输出可能不是合法的 UTF-8
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

static int serve(arbiter::orchestrator &judge, arbiter::server::mysql::store &store, size_t workers) {
    signal(SIGINT, sigintHandler);

    arbiter::contest_reconciler reconciler(store, arbiter::CONTEST_SWEEP_INTERVAL);
    reconciler.start();

    arbiter::concurrent_queue<string> task_queue;
    vector<thread> worker_threads;
    for (size_t i = 0; i < workers; ++i)
        worker_threads.push_back(arbiter::start_worker(i, task_queue, judge, store));

    // 主线程负责定时检查卡住的提交
    time_t last_sweep = 0;
    while (!interrupted) {
        time_t now = time(nullptr);
        if (now - last_sweep >= arbiter::STALE_SWEEP_INTERVAL) {
            try {
                judge.sweep_stale(now, arbiter::STALE_RUNNING_SECONDS);
            } catch (exception &ex) {
                LOG(ERROR) << "Unable to sweep stale submissions, " << ex.what();
            }
            last_sweep = now;
        }
        this_thread::sleep_for(chrono::seconds(1));
    }

    for (auto &th : worker_threads)
        th.join();
    reconciler.stop();
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("arbiter options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("mode", po::value<string>()->default_value("serve"), "serve: judge pending submissions until SIGINT\n"
                                                              "judge <submission>: judge one submission and print the result\n"
                                                              "leaderboard <contest>: print the leaderboard of a contest\n"
                                                              "sweep: re-offer submissions stuck in RUNNING state")
        ("argument", po::value<string>(), "submission id for judge mode, contest id for leaderboard mode")
        ("config", po::value<string>(), "set the configuration file path. You can either pass it from environ ARBITER_CONFIG")
        ("workers", po::value<size_t>(), "set the number of worker threads, default to 4. You can either pass it from environ WORKERS")
        ("backend-overhead", po::value<int>(), "set the time in milliseconds to wait for the judge backend in addition to the time limit, default to 10000. You can either pass it from environ BACKEND_OVERHEAD")
        ("stale-running", po::value<int>(), "set the time in seconds after which a RUNNING submission is considered stuck, default to 600. You can either pass it from environ STALE_RUNNING")
        ("contest-sweep-interval", po::value<int>(), "set the interval in seconds of contest phase transition, default to 30. You can either pass it from environ CONTEST_SWEEP_INTERVAL")
        ("debug", "turn on the debug mode to log full requests and responses of the judge backend.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("mode", 1).add("argument", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
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
        cout << "arbiter: Judge submissions on Judge0, maintain contest state" << endl
             << "Usage: " << argv[0] << " [serve|judge <submission>|leaderboard <contest>|sweep] [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "arbiter 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || !get_env("DEBUG", "").empty())
        arbiter::DEBUG = true;

    string config_path;
    CHECK(read_option(vm, "config", "ARBITER_CONFIG", config_path))
        << "Configuration file should be specified by --config or ARBITER_CONFIG";
    CHECK(filesystem::is_regular_file(config_path))
        << "Configuration file " << config_path << " does not exist";

    size_t workers = 4;
    read_option(vm, "workers", "WORKERS", workers);
    read_option(vm, "backend-overhead", "BACKEND_OVERHEAD", arbiter::BACKEND_OVERHEAD_MS);
    read_option(vm, "stale-running", "STALE_RUNNING", arbiter::STALE_RUNNING_SECONDS);
    read_option(vm, "contest-sweep-interval", "CONTEST_SWEEP_INTERVAL", arbiter::CONTEST_SWEEP_INTERVAL);

    json config;
    arbiter::server::backend backend;
    arbiter::server::database database;
    arbiter::server::runner runner_config;
    arbiter::leaderboard_options leaderboard_config;
    vector<arbiter::language_config> languages;
    try {
        config = json::parse(arbiter::read_file_content(config_path));
        backend = config.at("judge0").get<arbiter::server::backend>();
        arbiter::BACKEND_CONNECT_TIMEOUT_MS = config.at("judge0").value("connect_timeout_ms", arbiter::BACKEND_CONNECT_TIMEOUT_MS);
        database = config.at("database").get<arbiter::server::database>();
        if (config.count("runner"))
            runner_config = config.at("runner").get<arbiter::server::runner>();
        if (config.count("languages"))
            languages = config.at("languages").get<vector<arbiter::language_config>>();
        else
            languages = arbiter::language_registry::default_languages();
        if (config.count("leaderboard"))
            leaderboard_config.wrong_attempt_penalty = config.at("leaderboard").value("wrong_attempt_penalty", 0.0);
    } catch (std::exception &e) {
        LOG(FATAL) << "Configuration file " << config_path << " is malformed: " << e.what();
    }

    CHECK(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) << "Unable to initialize libcurl";

    string mode = vm.at("mode").as<string>();
    int ret = EXIT_SUCCESS;
    try {
        arbiter::language_registry registry(languages);
        arbiter::server::mysql::store store(database);
        arbiter::judge0::client client(backend);
        arbiter::testcase_runner runner(client, registry, runner_config);
        arbiter::orchestrator judge(store, store, store, registry, runner);

        if (mode == "serve") {
            ret = serve(judge, store, workers);
        } else if (mode == "judge") {
            CHECK(vm.count("argument")) << "Submission id should be specified";
            json j = judge.judge(vm.at("argument").as<string>());
            cout << dump(j) << endl;
        } else if (mode == "leaderboard") {
            CHECK(vm.count("argument")) << "Contest id should be specified";
            arbiter::leaderboard_service service(store, store, leaderboard_config);
            json j = service.compute(vm.at("argument").as<string>());
            cout << dump(j) << endl;
        } else if (mode == "sweep") {
            int count = judge.sweep_stale(time(nullptr), arbiter::STALE_RUNNING_SECONDS);
            cout << "Re-offered " << count << " submissions" << endl;
        } else {
            cerr << "Unrecognized mode " << mode << endl
                 << desc << endl;
            ret = EXIT_FAILURE;
        }
    } catch (arbiter::already_judging &ex) {
        cerr << ex.what() << ", please retry later" << endl;
        ret = EXIT_FAILURE;
    } catch (std::exception &ex) {
        LOG(ERROR) << ex.what() << endl
                   << boost::diagnostic_information(ex);
        ret = EXIT_FAILURE;
    }

    curl_global_cleanup();
    return ret;
}
