#include "logging.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/common.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <deque>
#include <iomanip>
#include <iostream>
using namespace std;

thread_local deque<string> prefix_stack;

string LOG_PREFIX(const char *file, int line, const char *function) {
    filesystem::path path(file);
    return "[" + boost::algorithm::join(prefix_stack, "-") + ":" + path.filename().string() + ":" + to_string(line) + ":" + string(function) + "] ";
}

void LOG_BEGIN(const string &prefix) {
    prefix_stack.push_back(prefix);
}

void LOG_END() {
    if (prefix_stack.empty()) {
        BOOST_LOG_TRIVIAL(warning) << "LOG_END without paired LOG_BEGIN";
        return;
    }
    prefix_stack.pop_back();
}

namespace passk {

void init_logging(const filesystem::path &log_dir, bool debug) {
    boost::log::add_common_attributes();
    auto core = boost::log::core::get();

    // clang-format off
    auto log_format(
        boost::log::expressions::stream <<
            "[" << boost::log::expressions::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S") <<
            "] [" << boost::log::expressions::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") <<
            "] [" << std::left << std::setw(7) << std::setfill(' ') << boost::log::trivial::severity <<
            "] " << boost::log::expressions::smessage
        );

    if (!log_dir.empty()) {
        boost::log::add_file_log(
            boost::log::keywords::file_name = "passk_%d_%m_%Y.%N.log",
            boost::log::keywords::rotation_size = 1 * 1024 * 1024,  // 每1M滚动一次日志
            boost::log::keywords::target = log_dir,
            boost::log::keywords::max_size = 20 * 1024 * 1024, // 最多存储20M日志
            boost::log::keywords::time_based_rotation = boost::log::sinks::file::rotation_at_time_point(boost::gregorian::greg_day(1)),
            boost::log::keywords::scan_method = boost::log::sinks::file::scan_matching,
            boost::log::keywords::format = log_format,
            boost::log::keywords::auto_flush = true);
    }
    // clang-format on

    boost::log::add_console_log(std::clog, boost::log::keywords::format = log_format);

    core->set_filter(boost::log::trivial::severity >= (debug ? boost::log::trivial::debug : boost::log::trivial::info));
}

}  // namespace passk
