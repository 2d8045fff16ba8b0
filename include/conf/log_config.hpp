#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace qbeecli {

struct LoggingConfig {
  std::string level{"info"};
  // Empty disables logging entirely.
  std::string log_dir;
  std::string log_file{"qbee-cli"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const boost::json::value_to_tag<LoggingConfig> &,
                                  const boost::json::value &jv) {
    LoggingConfig cfg{};
    if (auto *obj = jv.if_object()) {
      if (auto *p = obj->if_contains("level"); p && p->is_string()) {
        cfg.level = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("log_dir"); p && p->is_string()) {
        cfg.log_dir = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("log_file"); p && p->is_string()) {
        cfg.log_file = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("rotation_size")) {
        cfg.rotation_size = p->to_number<std::uint64_t>();
      }
      return cfg;
    }
    throw std::runtime_error("LoggingConfig is not an object");
  }

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const LoggingConfig &cfg) {
    jv = boost::json::object{{"level", cfg.level},
                             {"log_dir", cfg.log_dir},
                             {"log_file", cfg.log_file},
                             {"rotation_size", cfg.rotation_size}};
  }
};

}  // namespace qbeecli
