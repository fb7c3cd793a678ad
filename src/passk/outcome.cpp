#include "passk/outcome.hpp"

namespace passk {
using namespace std;
using namespace nlohmann;

const char *get_wire_status(status s) {
    switch (s) {
        case status::PASS:
            return "OK";
        case status::COMPILE_ERROR:
            return "CompileError";
        case status::RUNTIME_ERROR:
            return "RuntimeError";
        case status::TIMEOUT:
            return "Timeout";
        case status::INTERNAL_ERROR:
            return "InternalError";
    }
    return "InternalError";
}

const char *get_stage_name(stage s) {
    switch (s) {
        case stage::NONE:
            return "none";
        case stage::COMPILE:
            return "compile";
        case stage::RUN:
            return "run";
    }
    return "none";
}

bool outcome::passed() const {
    return status == status::PASS;
}

void to_json(json &j, const outcome &o) {
    j = {{"status", get_wire_status(o.status)},
         {"task_id", o.task_id},
         {"stdout", o.stdout_text},
         {"stderr", o.stderr_text},
         {"pass", o.passed()},
         {"wall_time", o.wall_time}};
    if (o.exit_code)
        j["exit_code"] = *o.exit_code;
    if (o.status == status::TIMEOUT)
        j["stage"] = get_stage_name(o.stage);
}

outcome make_internal_error(const string &task_id, const string &message) {
    outcome result;
    result.status = status::INTERNAL_ERROR;
    result.stage = stage::NONE;
    result.task_id = task_id;
    result.stderr_text = message;
    return result;
}

}  // namespace passk
