#include "worker.hpp"

#include <sys/prctl.h>

#include <algorithm>
#include <atomic>
#include <boost/exception/diagnostic_information.hpp>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "logging.hpp"
#include "passk/result_collector.hpp"

namespace passk {
using namespace std;

// 停止 worker 的标记
static atomic<bool> stopping_workers{false};

static vector<unique_ptr<monitor>> monitors;

void register_monitor(unique_ptr<monitor> &&monitor) {
    monitors.push_back(move(monitor));
    LOG_INFO << "Register monitor.";
}

static void call_monitor(int worker_id, function<void(monitor &)> callback) {
    try {
        for (auto &monitor : monitors) callback(*monitor);
    } catch (std::exception &ex) {
        LOG_ERROR << "Worker " << worker_id << " has crashed when reporting monitoring information, " << ex.what();
    }
}

/**
 * @brief 所有 worker 共享的评测状态
 */
struct evaluation_context {
    const sandbox_executor &executor;
    concurrent_queue<attempt> queue;
    result_collector collector;

    mutex records_mutex;
    vector<attempt_record> records;

    atomic<size_t> infrastructure_errors{0};

    explicit evaluation_context(const sandbox_executor &executor) : executor(executor) {}
};

/**
 * @brief 评测一个候选补全
 * 评测环境的错误不会向上抛出，也不会计入评测结果，而是单独记录并报告给 monitor
 */
static void evaluate_attempt(int worker_id, evaluation_context &ctx, const attempt &request) {
    optional<outcome> result;
    call_monitor(worker_id, [&](monitor &m) { m.start_attempt(worker_id, request); });
    defer {
        // 使用 defer 是希望即使评测崩溃也可以发送 end_attempt 避免 passk_workers_busy 只增不减
        call_monitor(worker_id, [&](monitor &m) { m.end_attempt(worker_id, request, result ? &*result : nullptr); });
    };

    string failure;
    try {
        result = ctx.executor.execute(request);
    } catch (sandbox_unavailable &ex) {
        LOG_ERROR << "Sandbox unavailable: " << ex.what() << endl
                  << boost::diagnostic_information(ex);
        failure = ex.what();
    } catch (std::exception &ex) {
        LOG_ERROR << "Unable to evaluate: " << ex.what() << endl
                  << boost::diagnostic_information(ex);
        failure = ex.what();
    }

    if (result) {
        ctx.collector.record(request.task_id, request.candidate, result->passed());
    } else {
        ++ctx.infrastructure_errors;
        call_monitor(worker_id, [&](monitor &m) { m.report_error(worker_id, failure); });
    }

    scoped_lock guard(ctx.records_mutex);
    ctx.records.push_back({request, result, failure});
}

static void worker_loop(int worker_id, evaluation_context &ctx) {
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::START, ""); });
    LOG_BEGIN("worker" + to_string(worker_id));

    while (!stopping_workers) {
        attempt request;
        // 所有候选补全在 worker 启动前入队，队列为空即评测结束
        if (!ctx.queue.try_pop(request)) break;

        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::EVALUATING, ""); });
        LOG_BEGIN(request.task_id + "#" + to_string(request.candidate));
        try {
            evaluate_attempt(worker_id, ctx, request);
        } catch (std::exception &ex) {
            LOG_ERROR << "Worker " << worker_id << " crashed: " << ex.what() << endl
                      << boost::diagnostic_information(ex);
            call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::CRASHED, ex.what()); });
        }
        LOG_END();
        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });
    }

    LOG_END();
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::STOPPED, ""); });
}

static thread start_worker(int worker_id, evaluation_context &ctx) {
    LOG_DEBUG << "Start worker" << worker_id;

    return thread([worker_id, &ctx] {
        prctl(PR_SET_NAME, ("worker" + to_string(worker_id)).c_str(), 0, 0, 0);
        worker_loop(worker_id, ctx);
    });
}

evaluation_report run_workers(const sandbox_executor &executor, const vector<attempt> &attempts, size_t workers) {
    if (workers == 0)
        BOOST_THROW_EXCEPTION(passk_exception("at least one worker is required"));

    evaluation_context ctx(executor);

    map<string, size_t> samples;
    for (auto &request : attempts) {
        size_t &count = samples[request.task_id];
        count = max(count, request.candidate + 1);
    }
    for (auto &[task_id, count] : samples) ctx.collector.register_task(task_id, count);
    for (auto &request : attempts) ctx.queue.push(request);

    size_t worker_count = min(workers, max<size_t>(attempts.size(), 1));
    vector<thread> worker_threads;
    for (size_t i = 0; i < worker_count; ++i)
        worker_threads.push_back(start_worker(i, ctx));
    LOG_INFO << "Started " << worker_count << " workers for " << attempts.size() << " attempts";

    for (auto &th : worker_threads)
        th.join();

    evaluation_report report;
    report.results = ctx.collector.snapshot();
    report.attempts = move(ctx.records);
    sort(report.attempts.begin(), report.attempts.end(), [](const attempt_record &a, const attempt_record &b) {
        return make_pair(a.request.task_id, a.request.candidate) < make_pair(b.request.task_id, b.request.candidate);
    });
    report.infrastructure_errors = ctx.infrastructure_errors;
    report.skipped = attempts.size() - report.attempts.size();
    if (report.skipped)
        LOG_WARN << report.skipped << " attempts were not evaluated";
    return report;
}

void to_json(nlohmann::json &j, const attempt_record &record) {
    if (record.result) {
        j = *record.result;
    } else {
        j = {{"task_id", record.request.task_id},
             {"infrastructure_error", true},
             {"error", record.infrastructure_error}};
    }
    j["candidate"] = record.request.candidate;
}

void stop_workers() {
    stopping_workers = true;

    call_monitor(0, [&](monitor &m) { m.interrupt_attempts(); });
}

bool workers_stopping() {
    return stopping_workers;
}

}  // namespace passk
