#include <fmt/core.h>
#include <signal.h>

#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <set>
#include <thread>

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "monitor/interrupt_monitor.hpp"
#include "monitor/prometheus.hpp"
#include "passk/aggregator.hpp"
#include "passk/dataset.hpp"
#include "passk/executor.hpp"
#include "worker.hpp"
using namespace std;

namespace fs = std::filesystem;

struct k_values {
    string literal;
    set<int> values;
};

k_values parse_k_values(const string& s) {
    using namespace boost::program_options;
    k_values result;
    result.literal = s;

    vector<string> splitted;
    boost::split(splitted, s, boost::is_any_of(","));
    for (auto& token : splitted) {
        boost::trim(token);
        if (token.empty()) continue;
        int k;
        try {
            k = boost::lexical_cast<int>(token);
        } catch (boost::bad_lexical_cast&) {
            throw validation_error(validation_error::invalid_option_value);
        }
        if (k <= 0)
            throw validation_error(validation_error::invalid_option_value);
        result.values.insert(k);
    }
    return result;
}

void validate(boost::any& v, const vector<string>& values, k_values*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const& s = validators::get_single_string(values);
    v = parse_k_values(s);
}

/**
 * @brief 同步地等待 SIGINT、SIGTERM
 * 信号在 main 中对所有线程屏蔽，只由这个线程通过 sigwait 接收，因此可以加锁和输出日志
 */
static void wait_signals(sigset_t signals) {
    int sigint = 0;
    while (true) {
        int signum;
        if (sigwait(&signals, &signum) != 0) continue;

        if (signum == SIGINT) {
            if (sigint == 0) {
                LOG_ERROR << "Received SIGINT, stopping workers (Press Ctrl+C again to terminate this app)";
            } else {
                LOG_ERROR << "Received SIGINT, terminating";
            }
        } else if (signum == SIGTERM) {
            LOG_ERROR << "Received SIGTERM, stopping workers";
        }

        if (sigint == 0)
            passk::stop_workers();
        else
            exit(130);

        sigint++;
    }
}

static void write_attempts(const fs::path& path, const vector<passk::attempt_record>& records) {
    string content;
    for (auto& record : records)
        content += passk::dump_json(nlohmann::json(record)) + "\n";
    passk::write_file_content(path, content);
}

/**
 * @brief 评测数据集中所有题目的候选补全，输出 evaluate_passk.json 和 attempts.jsonl
 */
static int evaluate(const boost::program_options::variables_map& vm, const passk::execution_config& config) {
    if (!vm.count("dataset") || !vm.count("result-dir")) {
        LOG_FATAL << "--dataset and --result-dir are required unless --execute is given";
        return EXIT_FAILURE;
    }

    set<int> ks = vm.at("k").as<k_values>().values;
    size_t max_k = ks.empty() ? 100 : *ks.rbegin();

    fs::path result_dir = vm.at("result-dir").as<string>();
    fs::create_directories(result_dir);

    auto tasks = passk::load_dataset(vm.at("dataset").as<string>());
    if (tasks.empty()) {
        LOG_FATAL << "No problems in dataset";
        return EXIT_FAILURE;
    }

    passk::completion_map completions;
    if (vm.count("completions")) {
        completions = passk::load_completions(vm.at("completions").as<string>(), max_k);
    } else if (vm.count("completions-dir")) {
        completions = passk::load_completions_dir(vm.at("completions-dir").as<string>(), max_k);
    } else {
        LOG_FATAL << "Provide --completions or --completions-dir";
        return EXIT_FAILURE;
    }

    if (vm.count("dry-run")) {
        size_t with_completions = 0;
        for (auto& [task_id, samples] : completions)
            if (!samples.empty()) ++with_completions;
        LOG_INFO << "Dry run: " << tasks.size() << " problems, " << with_completions
                 << " tasks with completions, k=" << vm.at("k").as<k_values>().literal;
        return EXIT_SUCCESS;
    }

    vector<string> task_ids;
    for (auto& [task_id, t] : tasks) task_ids.push_back(task_id);

    passk::sandbox_executor executor(config);
    passk::evaluation_report report = passk::run_workers(executor, passk::make_attempts(tasks, completions), vm.at("workers").as<size_t>());
    passk::evaluation_metrics m = passk::aggregate(task_ids, report.results, ks);

    fs::path out_file = result_dir / "evaluate_passk.json";
    passk::write_file_content(out_file, passk::dump_json(nlohmann::json(m), 2) + "\n");
    write_attempts(result_dir / "attempts.jsonl", report.attempts);

    LOG_INFO << fmt::format("pass@1={:.4f} resolved={}/{}", m.pass_at_1, m.resolved, m.total);
    LOG_INFO << "Wrote " << out_file;

    if (passk::workers_stopping()) {
        LOG_WARN << "Evaluation was interrupted, metrics only cover evaluated attempts";
        return 130;
    }
    if (report.infrastructure_errors) {
        LOG_ERROR << report.infrastructure_errors << " attempts could not be evaluated because the sandbox was unavailable";
        return passk::EXIT_SANDBOX_UNAVAILABLE;
    }
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    /*** handle options ***/

    namespace po = boost::program_options;
    po::options_description desc("passk-harness options");
    po::variables_map vm;

    size_t default_workers = max(1u, thread::hardware_concurrency());

    // clang-format off
    desc.add_options()
        ("execute", "read one attempt request JSON from stdin, print the outcome JSON to stdout")
        ("dataset", po::value<string>(), "dataset JSONL, one task {task_id, prompt, tests} per line")
        ("completions", po::value<string>(), "completions JSONL, one {task_id, solution} per line")
        ("completions-dir", po::value<string>(), "directory with <task_id>.jsonl or <task_id>.json completions")
        ("result-dir", po::value<string>(), "output directory for evaluate_passk.json and attempts.jsonl")
        ("k", po::value<k_values>()->default_value(parse_k_values("1,10,100"), "1,10,100"), "comma-separated k values for pass@k")
        ("workers", po::value<size_t>()->default_value(default_workers), "number of attempts evaluated concurrently")
        ("dry-run", "only load and count, do not run the sandbox")
        ("config", po::value<string>(), "JSON configuration file of the sandbox")
        ("compile-time-limit", po::value<double>(), "compile time limit in seconds, default to 30. You can either pass it from environ PASSK_COMPILE_TIMEOUT")
        ("run-time-limit", po::value<double>(), "run time limit in seconds, default to 10. You can either pass it from environ PASSK_RUN_TIMEOUT")
        ("compiler", po::value<string>(), "C++ compiler, default to g++. You can either pass it from environ PASSK_CXX")
        ("work-root", po::value<string>(), "directory to create working directories in, default to the system temporary directory. You can either pass it from environ PASSK_WORK_ROOT")
        ("network-isolation", po::value<string>(), "required, best_effort or disabled, default to required. You can either pass it from environ PASSK_NETWORK_ISOLATION")
        ("log-dir", po::value<string>(), "also write logs to this directory. You can either pass it from environ PASSK_LOG_DIR")
        ("debug", "output debug logs. You can either pass it from environ PASSK_DEBUG")
        ("metric-addr", po::value<string>(), "set the address that Prometheus-metrics exposed. Fomat x.x.x.x:x")
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
        cout << "passk-harness: compile and run candidate completions in a sandbox, compute pass@k" << endl
             << "Usage: " << argv[0] << " --execute < attempt.json" << endl
             << "       " << argv[0] << " --dataset F (--completions F | --completions-dir D) --result-dir D [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "passk-harness 1.0" << endl;
        return EXIT_SUCCESS;
    }

    fs::path log_dir = vm.count("log-dir") ? vm.at("log-dir").as<string>() : get_env("PASSK_LOG_DIR");
    bool debug = vm.count("debug") || getenv("PASSK_DEBUG");
    passk::init_logging(log_dir, debug);

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    thread(wait_signals, signals).detach();

    /*** configuration ***/

    passk::execution_config config;
    try {
        optional<fs::path> config_path;
        if (vm.count("config")) config_path = vm.at("config").as<string>();
        config = passk::load_execution_config(config_path);

        if (vm.count("compile-time-limit"))
            config.compile_budget = vm.at("compile-time-limit").as<double>();
        if (vm.count("run-time-limit"))
            config.run_budget = vm.at("run-time-limit").as<double>();
        if (vm.count("compiler"))
            config.compiler = vm.at("compiler").as<string>();
        if (vm.count("work-root"))
            config.work_root = vm.at("work-root").as<string>();
        if (vm.count("network-isolation"))
            config.isolation = passk::parse_network_isolation(vm.at("network-isolation").as<string>());
        passk::validate(config);
    } catch (passk::passk_exception& ex) {
        LOG_FATAL << "Invalid configuration: " << ex.what();
        return EXIT_FAILURE;
    }

    LOG_DEBUG << "compile_budget = " << config.compile_budget << ", run_budget = " << config.run_budget
              << ", compiler = " << config.compiler << ", network isolation = " << passk::isolation_name(config.isolation);

    if (vm.count("execute")) return passk::execute_request(config, cin, cout);

    /*** monitor ***/

    passk::register_monitor(make_unique<passk::interrupt_monitor>());

    /*** metrics ***/

    string metric_addr = get_env("PASSK_METRIC_ADDR");
    if (vm.count("metric-addr"))
        metric_addr = vm.at("metric-addr").as<string>();

    unique_ptr<prometheus::Exposer> exposer;
    if (!metric_addr.empty()) {
        exposer = make_unique<prometheus::Exposer>(metric_addr, 2);
        auto registry = passk::metrics::global_registry();
        passk::register_monitor(make_unique<passk::prometheus_monitor>(registry));
        exposer->RegisterCollectable(registry);
        LOG_INFO << "Exposing metrics on " << metric_addr;
    }

    /*** evaluation ***/

    try {
        return evaluate(vm, config);
    } catch (std::exception& ex) {
        LOG_FATAL << "Evaluation failed: " << ex.what() << endl
                  << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }
}
