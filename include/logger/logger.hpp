#ifndef PEERDROP_LOGGER_HPP
#define PEERDROP_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace peerdrop::logging {

using severity_level = boost::log::trivial::severity_level;

struct LogConfig {
    severity_level min_level = boost::log::trivial::info;
    // Empty disables the file sink
    std::string log_file;
    bool console = true;
    std::size_t rotation_size = 10 * 1024 * 1024;  // 10 MB
};

// Replaces all sinks: console on stderr plus an optional rotating file
void init_logging(const LogConfig& config);

// Parses trace/debug/info/warning/error/fatal, throws std::invalid_argument otherwise
severity_level parse_severity(const std::string& name);

} // namespace peerdrop::logging

#endif // PEERDROP_LOGGER_HPP
