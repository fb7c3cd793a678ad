#include "passk/task.hpp"

#include <boost/algorithm/string/trim.hpp>

namespace passk {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, task &t) {
    t.task_id = first_nonempty(j, {"task_id", "name"});
    t.prompt = j.value("prompt", "");
    t.tests = j.value("tests", "");
}

void from_json(const json &j, attempt &a) {
    a.task_id = exists(j, "task_id") ? j.at("task_id").get<string>() : "unknown";
    a.prompt = exists(j, "prompt") ? j.at("prompt").get<string>() : "";
    if (exists(j, "solution"))
        j.at("solution").get_to(a.solution);
    else if (exists(j, "canonical_solution"))
        j.at("canonical_solution").get_to(a.solution);
    else
        a.solution = "";
    a.tests = exists(j, "tests") ? j.at("tests").get<string>() : "";
}

string attempt::source() const {
    return boost::algorithm::trim_copy(prompt + "\n" + solution + "\n" + tests);
}

}  // namespace passk
