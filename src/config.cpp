#include "config.hpp"

#include <boost/lexical_cast.hpp>

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "logging.hpp"

namespace passk {
using namespace std;
using namespace nlohmann;

network_isolation parse_network_isolation(const string &value) {
    if (value == "required") return network_isolation::REQUIRED;
    if (value == "best_effort") return network_isolation::BEST_EFFORT;
    if (value == "disabled") return network_isolation::DISABLED;
    BOOST_THROW_EXCEPTION(passk_exception() << "unrecognized network isolation mode " << value);
}

const char *isolation_name(network_isolation isolation) {
    switch (isolation) {
        case network_isolation::REQUIRED:
            return "required";
        case network_isolation::BEST_EFFORT:
            return "best_effort";
        case network_isolation::DISABLED:
            return "disabled";
    }
    return "unknown";
}

void from_json(const json &j, execution_config &config) {
    if (exists(j, "compileTimeLimit"))
        j.at("compileTimeLimit").get_to(config.compile_budget);
    if (exists(j, "runTimeLimit"))
        j.at("runTimeLimit").get_to(config.run_budget);
    if (exists(j, "compiler"))
        j.at("compiler").get_to(config.compiler);
    if (exists(j, "compileFlags"))
        j.at("compileFlags").get_to(config.compile_flags);
    if (exists(j, "maxOutputSize"))
        j.at("maxOutputSize").get_to(config.max_output_bytes);
    if (exists(j, "networkIsolation"))
        config.isolation = parse_network_isolation(j.at("networkIsolation").get<string>());
    if (exists(j, "workRoot"))
        config.work_root = j.at("workRoot").get<string>();
}

template <typename T>
static void override_from_env(const char *key, T &value) {
    if (!getenv(key)) return;
    try {
        value = boost::lexical_cast<T>(getenv(key));
    } catch (boost::bad_lexical_cast &) {
        BOOST_THROW_EXCEPTION(passk_exception() << "environment variable " << key << " is malformed: " << getenv(key));
    }
}

void apply_environment(execution_config &config) {
    override_from_env("PASSK_COMPILE_TIMEOUT", config.compile_budget);
    override_from_env("PASSK_RUN_TIMEOUT", config.run_budget);
    override_from_env("PASSK_MAX_OUTPUT", config.max_output_bytes);
    if (getenv("PASSK_CXX"))
        config.compiler = getenv("PASSK_CXX");
    if (getenv("PASSK_NETWORK_ISOLATION"))
        config.isolation = parse_network_isolation(getenv("PASSK_NETWORK_ISOLATION"));
    if (getenv("PASSK_WORK_ROOT"))
        config.work_root = getenv("PASSK_WORK_ROOT");
}

void validate(const execution_config &config) {
    if (!(config.compile_budget > 0 && config.compile_budget <= MAX_BUDGET_SECONDS))
        BOOST_THROW_EXCEPTION(passk_exception() << "compile time limit must be in (0, " << MAX_BUDGET_SECONDS << "], got " << config.compile_budget);
    if (!(config.run_budget > 0 && config.run_budget <= MAX_BUDGET_SECONDS))
        BOOST_THROW_EXCEPTION(passk_exception() << "run time limit must be in (0, " << MAX_BUDGET_SECONDS << "], got " << config.run_budget);
    if (config.compiler.empty())
        BOOST_THROW_EXCEPTION(passk_exception("compiler must not be empty"));
    if (config.max_output_bytes == 0)
        BOOST_THROW_EXCEPTION(passk_exception("max output size must be positive"));
}

execution_config load_execution_config(const optional<filesystem::path> &config_path) {
    execution_config config;
    if (config_path) {
        LOG_INFO << "Loading configuration file " << *config_path;
        try {
            json::parse(read_file_content(*config_path)).get_to(config);
        } catch (json::exception &ex) {
            BOOST_THROW_EXCEPTION(passk_exception() << "configuration file " << *config_path << " is malformed: " << ex.what());
        }
    }
    apply_environment(config);
    validate(config);
    return config;
}

}  // namespace passk
