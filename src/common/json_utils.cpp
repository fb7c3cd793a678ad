#include "common/json_utils.hpp"

namespace nlohmann {
using namespace std;

bool exists(const json &j, const string &key) {
    return j.is_object() && j.count(key) && !j.at(key).is_null();
}

}  // namespace nlohmann

namespace passk {
using namespace std;

string dump_json(const nlohmann::json &j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

string first_nonempty(const nlohmann::json &j, const vector<string> &keys) {
    for (auto &key : keys) {
        if (!nlohmann::exists(j, key)) continue;
        string value = j.at(key).get<string>();
        if (!value.empty()) return value;
    }
    return "";
}

}  // namespace passk
