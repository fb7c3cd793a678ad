#include "passk/executor.hpp"

#include <boost/exception/diagnostic_information.hpp>
#include <cstdlib>
#include <iostream>
#include <iterator>

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/scoped_directory.hpp"
#include "common/utils.hpp"
#include "logging.hpp"

namespace passk {
using namespace std;

static const string SOURCE_FILE = "main.cpp";
static const string BINARY_FILE = "main";

static void append_line(string &text, const string &line) {
    if (!text.empty() && text.back() != '\n') text += '\n';
    text += line;
}

sandbox_executor::sandbox_executor(execution_config config) : cfg(move(config)) {}

const execution_config &sandbox_executor::config() const {
    return cfg;
}

outcome sandbox_executor::execute(const attempt &request) const {
    return execute(request, cfg.compile_budget, cfg.run_budget);
}

outcome sandbox_executor::execute(const attempt &request, double compile_budget, double run_budget) const {
    // Pending -> InternalError：请求不合法时不创建工作文件夹，也不编译
    if (request.prompt.empty() && request.solution.empty()) {
        LOG_WARN << "Attempt of task " << request.task_id << " has neither prompt nor solution";
        return make_internal_error(request.task_id, "missing prompt/solution");
    }

    elapsed_time elapsed;
    outcome result = compile_and_run(request, compile_budget, run_budget);
    result.wall_time = elapsed.seconds();

    LOG_DEBUG << "Attempt of task " << request.task_id << " finished with " << get_wire_status(result.status)
              << " in " << elapsed.duration<chrono::milliseconds>().count() << "ms";
    return result;
}

outcome sandbox_executor::compile_and_run(const attempt &request, double compile_budget, double run_budget) const {
    outcome result;
    result.task_id = request.task_id;

    // 工作文件夹只属于本次评测，scoped_directory 析构时删除，包括抛出异常的情况
    scoped_directory workdir(cfg.work_root, "passk_");
    write_file_content(workdir.path() / SOURCE_FILE, request.source());

    /*** Compiling ***/

    process_result compiled = process_builder()
                                  .directory(workdir.path())
                                  .timeout(compile_budget)
                                  .output_limit(cfg.max_output_bytes)
                                  .isolate_network(network_isolation::DISABLED)
                                  .run(cfg.compiler, cfg.compile_flags, "-o", BINARY_FILE, SOURCE_FILE);

    if (compiled.timed_out) {
        result.status = status::TIMEOUT;
        result.stage = stage::COMPILE;
        result.stdout_text = move(compiled.stdout_text);
        result.stderr_text = move(compiled.stderr_text);
        append_line(result.stderr_text, "compile timeout");
        return result;
    }

    if (compiled.exit_code != 0) {
        result.status = status::COMPILE_ERROR;
        result.stage = stage::COMPILE;
        result.stdout_text = move(compiled.stdout_text);
        result.stderr_text = move(compiled.stderr_text);
        return result;
    }

    /*** Running ***/

    process_result ran = process_builder()
                             .directory(workdir.path())
                             .timeout(run_budget)
                             .output_limit(cfg.max_output_bytes)
                             .isolate_network(cfg.isolation)
                             .run("./" + BINARY_FILE);

    result.stage = stage::RUN;
    result.stdout_text = move(ran.stdout_text);
    result.stderr_text = move(ran.stderr_text);
    if (ran.timed_out) {
        result.status = status::TIMEOUT;
        append_line(result.stderr_text, "execution timeout");
        return result;
    }

    result.exit_code = ran.exit_code;
    result.status = ran.exit_code == 0 ? status::PASS : status::RUNTIME_ERROR;
    if (ran.signal)
        LOG_DEBUG << "Program of task " << request.task_id << " killed by signal " << ran.signal;
    return result;
}

outcome execute(const string &task_id, const string &prompt, const string &solution, const string &tests,
                double compile_budget, double run_budget) {
    attempt request;
    request.task_id = task_id;
    request.prompt = prompt;
    request.solution = solution;
    request.tests = tests;

    execution_config config;
    apply_environment(config);
    return sandbox_executor(config).execute(request, compile_budget, run_budget);
}

int execute_request(const execution_config &config, istream &in, ostream &out) {
    string input((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());

    attempt request;
    try {
        request = nlohmann::json::parse(input).get<attempt>();
    } catch (nlohmann::json::exception &ex) {
        LOG_WARN << "Malformed attempt request: " << ex.what();
        out << dump_json(nlohmann::json(make_internal_error("unknown", ex.what()))) << endl;
        return EXIT_FAILURE;
    }

    LOG_BEGIN(request.task_id);
    try {
        outcome result = sandbox_executor(config).execute(request);
        LOG_END();
        out << dump_json(nlohmann::json(result)) << endl;
        return result.status == status::INTERNAL_ERROR ? EXIT_FAILURE : EXIT_SUCCESS;
    } catch (passk_exception &ex) {
        LOG_FATAL << "Unable to evaluate attempt: " << ex.what() << endl
                  << boost::diagnostic_information(ex);
        LOG_END();
        return EXIT_SANDBOX_UNAVAILABLE;
    }
}

}  // namespace passk
