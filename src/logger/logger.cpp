#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace blobshard::logging {

namespace {

namespace bl = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

auto make_formatter() {
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << bl::trivial::severity << "]"
        << " [Thread " << expr::attr<bl::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage;
}

} // namespace

void init_logging(const LogConfig& config) {
    auto core = bl::core::get();
    core->remove_all_sinks();
    bl::add_common_attributes();

    if (config.console) {
        bl::add_console_log(
            std::clog,
            keywords::format = make_formatter(),
            keywords::auto_flush = true
        );
    }

    if (!config.file.empty()) {
        std::filesystem::path log_path = std::filesystem::absolute(config.file);
        bl::add_file_log(
            keywords::file_name = log_path.string(),
            keywords::format = make_formatter(),
            keywords::rotation_size = config.rotation_size,
            keywords::open_mode = std::ios::out | std::ios::app,
            keywords::auto_flush = true
        );
    }

    core->set_filter(bl::trivial::severity >= config.level);
    // With no sinks Boost.Log falls back to a default one, so disable output instead
    core->set_logging_enabled(config.console || !config.file.empty());

    BOOST_LOG_TRIVIAL(debug) << "Logger: Initialized at level " << severity_to_string(config.level)
                             << (config.file.empty() ? "" : ", writing to " + config.file);
}

boost::log::trivial::severity_level parse_severity(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return bl::trivial::trace;
    if (lower == "debug") return bl::trivial::debug;
    if (lower == "info") return bl::trivial::info;
    if (lower == "warning" || lower == "warn") return bl::trivial::warning;
    if (lower == "error") return bl::trivial::error;
    if (lower == "fatal") return bl::trivial::fatal;
    throw std::invalid_argument("unknown log level '" + name + "'");
}

const char* severity_to_string(boost::log::trivial::severity_level level) {
    switch (level) {
        case bl::trivial::trace:   return "trace";
        case bl::trivial::debug:   return "debug";
        case bl::trivial::info:    return "info";
        case bl::trivial::warning: return "warning";
        case bl::trivial::error:   return "error";
        case bl::trivial::fatal:   return "fatal";
    }
    return "unknown";
}

} // namespace blobshard::logging
