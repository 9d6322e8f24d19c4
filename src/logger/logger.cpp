#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace peerdrop::logging {

void init_logging(const LogConfig& config) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    auto format = (
      expr::stream
        << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "]"
        << " [" << logging::trivial::severity << "] "
        << expr::smessage
    );

    if (config.console) {
      logging::add_console_log(
        std::clog,
        keywords::format = format,
        keywords::auto_flush = true
      );
    }

    if (!config.log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(config.log_file);
      logging::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::format = format,
        keywords::rotation_size = config.rotation_size,
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::auto_flush = true
      );
    }

    logging::core::get()->set_filter(logging::trivial::severity >= config.min_level);
    logging::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

severity_level parse_severity(const std::string& name) {
  if (name == "trace")   return boost::log::trivial::trace;
  if (name == "debug")   return boost::log::trivial::debug;
  if (name == "info")    return boost::log::trivial::info;
  if (name == "warning") return boost::log::trivial::warning;
  if (name == "error")   return boost::log::trivial::error;
  if (name == "fatal")   return boost::log::trivial::fatal;
  throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace peerdrop::logging
