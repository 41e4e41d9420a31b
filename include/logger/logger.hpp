#ifndef BLOBSHARD_LOGGER_HPP
#define BLOBSHARD_LOGGER_HPP

#include <cstdint>
#include <string>
#include <boost/log/trivial.hpp>

namespace blobshard::logging {

struct LogConfig {
    boost::log::trivial::severity_level level{boost::log::trivial::info};
    // Console output goes to stderr so command output on stdout stays clean
    bool console{true};
    // Empty disables the file sink
    std::string file;
    uint64_t rotation_size{10 * 1024 * 1024};  // 10 MB
};

// Replaces all sinks with the ones described by config
void init_logging(const LogConfig& config);

// "trace", "debug", "info", "warning", "error" or "fatal", throws std::invalid_argument otherwise
boost::log::trivial::severity_level parse_severity(const std::string& name);

const char* severity_to_string(boost::log::trivial::severity_level level);

} // namespace blobshard::logging

#endif // BLOBSHARD_LOGGER_HPP
