#include "monitor/prometheus.hpp"

namespace passk {
using namespace std;

prometheus_monitor::prometheus_monitor(shared_ptr<prometheus::Registry> registry) : attempts_started(prometheus::BuildCounter()
                                                                                                         .Name("passk_attempts_started")
                                                                                                         .Help("The number of attempts that has started evaluating")
                                                                                                         .Register(*registry)),
                                                                                    attempts_finished(prometheus::BuildCounter()
                                                                                                          .Name("passk_attempts_finished")
                                                                                                          .Help("The number of attempts that has finished evaluating, by status")
                                                                                                          .Register(*registry)),
                                                                                    sandbox_errors(prometheus::BuildCounter()
                                                                                                       .Name("passk_sandbox_errors")
                                                                                                       .Help("The number of failures of the sandbox itself")
                                                                                                       .Register(*registry)),
                                                                                    workers_busy(prometheus::BuildGauge()
                                                                                                     .Name("passk_workers_busy")
                                                                                                     .Help("How many workers are evaluating attempts")
                                                                                                     .Register(*registry)),
                                                                                    worker_status(prometheus::BuildGauge()
                                                                                                      .Name("passk_workers_status")
                                                                                                      .Help("Show status of each worker (0:START   ; 1:EVALUATING   ; 2:IDLE   ; 3:CRASHED   ; 4:STOPPED)")
                                                                                                      .Register(*registry)) {}

void prometheus_monitor::start_attempt(int, const attempt &) {
    attempts_started.Add({}).Increment();
    workers_busy.Add({}).Increment();
}

void prometheus_monitor::end_attempt(int, const attempt &, const outcome *result) {
    attempts_finished.Add({{"status", result ? get_wire_status(result->status) : "SandboxUnavailable"}}).Increment();
    workers_busy.Add({}).Decrement();
}

void prometheus_monitor::report_error(int worker_id, const string &) {
    sandbox_errors.Add({{"worker_id", to_string(worker_id)}}).Increment();
}

void prometheus_monitor::worker_state_changed(int worker_id, worker_state state, const string & /* info */) {
    worker_status.Add({{"worker_id", to_string(worker_id)}}).Set(static_cast<int>(state));
}

}  // namespace passk
