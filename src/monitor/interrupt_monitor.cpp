#include "monitor/interrupt_monitor.hpp"

#include "logging.hpp"

using namespace std;

namespace passk {

void interrupt_monitor::start_attempt(int worker_id, const attempt &request) {
    scoped_lock guard(mut);
    running[worker_id] = make_pair(request.task_id, request.candidate);
}

void interrupt_monitor::end_attempt(int worker_id, const attempt &, const outcome *) {
    scoped_lock guard(mut);
    running.erase(worker_id);
}

void interrupt_monitor::interrupt_attempts() {
    scoped_lock guard(mut);
    for (auto &[worker_id, current] : running)
        LOG_WARN << "Worker " << worker_id << " is still evaluating candidate " << current.second
                 << " of task " << current.first << ", waiting for it to finish";
}

size_t interrupt_monitor::running_attempts() const {
    scoped_lock guard(mut);
    return running.size();
}

}  // namespace passk
