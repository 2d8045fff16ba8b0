#pragma once

#include <boost/json.hpp>

#include <stdexcept>

#include "conf/config_sources.hpp"

namespace qbeecli {

struct ConnectConfig {
  int retries{1};
  int backoff_base_ms{5000};
  int backoff_max_ms{60000};
  int keepalive_seconds{25};
  int io_threads{1};

  friend ConnectConfig tag_invoke(const boost::json::value_to_tag<ConnectConfig> &,
                                  const boost::json::value &jv) {
    ConnectConfig cfg{};
    if (auto *obj = jv.if_object()) {
      if (auto *p = obj->if_contains("retries")) {
        cfg.retries = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("backoff_base_ms")) {
        cfg.backoff_base_ms = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("backoff_max_ms")) {
        cfg.backoff_max_ms = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("keepalive_seconds")) {
        cfg.keepalive_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("io_threads")) {
        cfg.io_threads = p->to_number<int>();
      }
      return cfg;
    }
    throw std::runtime_error("ConnectConfig is not an object");
  }

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const ConnectConfig &cfg) {
    jv = boost::json::object{{"retries", cfg.retries},
                             {"backoff_base_ms", cfg.backoff_base_ms},
                             {"backoff_max_ms", cfg.backoff_max_ms},
                             {"keepalive_seconds", cfg.keepalive_seconds},
                             {"io_threads", cfg.io_threads}};
  }
};

class IConnectConfigProvider {
 public:
  virtual ~IConnectConfigProvider() = default;
  virtual const ConnectConfig &get() const = 0;
};

class ConnectConfigProviderFile : public IConnectConfigProvider {
 public:
  explicit ConnectConfigProviderFile(ConfigSources &config_sources) {
    if (auto jv = config_sources.json_content("connect_config")) {
      config_ = boost::json::value_to<ConnectConfig>(*jv);
    }
  }

  const ConnectConfig &get() const override { return config_; }

 private:
  ConnectConfig config_{};
};

}  // namespace qbeecli
