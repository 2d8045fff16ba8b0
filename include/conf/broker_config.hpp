#pragma once

#include <boost/json.hpp>

#include <stdexcept>
#include <string>

#include "conf/config_sources.hpp"

namespace qbeecli {

struct BrokerConfig {
  std::string listen_port{"8081"};
  std::string remote_host{"localhost"};
  std::string remote_port{"80"};
  std::string remote_protocol{"http"};
  // Empty means the broker accepts every request.
  std::string auth_token;
  int connection_ttl_seconds{300};
  int gc_interval_seconds{60};
  int reauth_interval_seconds{600};
  int session_cookie_ttl_seconds{3600};
  int port_ready_timeout_seconds{15};
  int io_threads{2};

  friend BrokerConfig tag_invoke(const boost::json::value_to_tag<BrokerConfig> &,
                                 const boost::json::value &jv) {
    BrokerConfig cfg{};
    if (auto *obj = jv.if_object()) {
      if (auto *p = obj->if_contains("listen_port"); p && p->is_string()) {
        cfg.listen_port = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("remote_host"); p && p->is_string()) {
        cfg.remote_host = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("remote_port"); p && p->is_string()) {
        cfg.remote_port = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("remote_protocol"); p && p->is_string()) {
        cfg.remote_protocol = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("auth_token"); p && p->is_string()) {
        cfg.auth_token = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("connection_ttl_seconds")) {
        cfg.connection_ttl_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("gc_interval_seconds")) {
        cfg.gc_interval_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("reauth_interval_seconds")) {
        cfg.reauth_interval_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("session_cookie_ttl_seconds")) {
        cfg.session_cookie_ttl_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("port_ready_timeout_seconds")) {
        cfg.port_ready_timeout_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("io_threads")) {
        cfg.io_threads = p->to_number<int>();
      }
      return cfg;
    }
    throw std::runtime_error("BrokerConfig is not an object");
  }

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const BrokerConfig &cfg) {
    jv = boost::json::object{
        {"listen_port", cfg.listen_port},
        {"remote_host", cfg.remote_host},
        {"remote_port", cfg.remote_port},
        {"remote_protocol", cfg.remote_protocol},
        {"connection_ttl_seconds", cfg.connection_ttl_seconds},
        {"gc_interval_seconds", cfg.gc_interval_seconds},
        {"reauth_interval_seconds", cfg.reauth_interval_seconds},
        {"session_cookie_ttl_seconds", cfg.session_cookie_ttl_seconds},
        {"port_ready_timeout_seconds", cfg.port_ready_timeout_seconds},
        {"io_threads", cfg.io_threads}};
  }
};

class IBrokerConfigProvider {
 public:
  virtual ~IBrokerConfigProvider() = default;
  virtual const BrokerConfig &get() const = 0;
  virtual BrokerConfig &get() = 0;
};

// broker_config.json, then QBEE_LISTEN_PORT, QBEE_REMOTE_HOST,
// QBEE_REMOTE_PORT, QBEE_REMOTE_PROTOCOL and QBEE_TOKEN.
class BrokerConfigProviderFile : public IBrokerConfigProvider {
 public:
  explicit BrokerConfigProviderFile(ConfigSources &config_sources) {
    if (auto jv = config_sources.json_content("broker_config")) {
      config_ = boost::json::value_to<BrokerConfig>(*jv);
    }
    apply_env(config_);
  }

  static void apply_env(BrokerConfig &cfg) {
    if (auto v = env_value("QBEE_LISTEN_PORT")) {
      cfg.listen_port = *v;
    }
    if (auto v = env_value("QBEE_REMOTE_HOST")) {
      cfg.remote_host = *v;
    }
    if (auto v = env_value("QBEE_REMOTE_PORT")) {
      cfg.remote_port = *v;
    }
    if (auto v = env_value("QBEE_REMOTE_PROTOCOL")) {
      cfg.remote_protocol = *v;
    }
    if (auto v = env_value("QBEE_TOKEN")) {
      cfg.auth_token = *v;
    }
  }

  const BrokerConfig &get() const override { return config_; }
  BrokerConfig &get() override { return config_; }

 private:
  BrokerConfig config_{};
};

}  // namespace qbeecli
