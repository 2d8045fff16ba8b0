#pragma once

#include <boost/log/attributes/constant.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/make_shared.hpp>

#include <fmt/format.h>

#include <memory>
#include <string>

#include "conf/log_config.hpp"

namespace logging = boost::log;
namespace src = boost::log::sources;
namespace sinks = boost::log::sinks;
namespace trivial = logging::trivial;

using LoggerPtr = std::shared_ptr<
    boost::log::sources::severity_logger<boost::log::trivial::severity_level>>;

// Logger tagged with the device it works for, so interleaved records from
// concurrently supervised devices can be told apart.
inline LoggerPtr make_logger_with_device(const std::string &device_id) {
  auto logger = std::make_shared<boost::log::sources::severity_logger<
      boost::log::trivial::severity_level>>();
  logger->add_attribute(
      "Device", boost::log::attributes::constant<std::string>(device_id));
  return logger;
}

inline trivial::severity_level severity_from_level(const std::string &level) {
  if (level == "trace") {
    return trivial::trace;
  } else if (level == "debug") {
    return trivial::debug;
  } else if (level == "warning") {
    return trivial::warning;
  } else if (level == "error") {
    return trivial::error;
  } else if (level == "fatal") {
    return trivial::fatal;
  }
  return trivial::info;
}

inline void init_my_log(const qbeecli::LoggingConfig &loggingConfig) {
  if (loggingConfig.log_dir.empty()) {
    // stdout and stderr belong to the tunnel, never to the default sink.
    logging::core::get()->set_logging_enabled(false);
    return;
  }
  std::string logfile = fmt::format("{}/{}_%N.log", loggingConfig.log_dir,
                                    loggingConfig.log_file);

  auto sink = logging::add_file_log(
      logging::keywords::file_name = logfile,
      logging::keywords::rotation_size = loggingConfig.rotation_size,
      logging::keywords::format =
          "[%TimeStamp%] [%Severity%] [%Device%]: %Message%",
      logging::keywords::auto_flush = true,
      logging::keywords::open_mode = std::ios_base::app);
  sink->locked_backend()->set_file_collector(
      logging::sinks::file::make_collector(
          logging::keywords::target = loggingConfig.log_dir,
          logging::keywords::max_size = loggingConfig.rotation_size * 10,
          logging::keywords::max_files = 10));
  sink->locked_backend()->scan_for_files();

  logging::add_common_attributes();
  logging::core::get()->set_filter(logging::trivial::severity >=
                                   severity_from_level(loggingConfig.level));
}
