#include "monitor/monitor.hpp"

namespace passk {
using namespace std;

const char *get_worker_state_name(worker_state state) {
    switch (state) {
        case worker_state::START:
            return "start";
        case worker_state::EVALUATING:
            return "evaluating";
        case worker_state::IDLE:
            return "idle";
        case worker_state::CRASHED:
            return "crashed";
        case worker_state::STOPPED:
            return "stopped";
    }
    return "unknown";
}

monitor::~monitor() {}

void monitor::start_attempt(int, const attempt &) {}

void monitor::end_attempt(int, const attempt &, const outcome *) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::report_error(int, const string &) {}

void monitor::interrupt_attempts() {}

}  // namespace passk
