#pragma once

#include <boost/json.hpp>

#include <stdexcept>
#include <string>

#include "conf/config_sources.hpp"

namespace qbeecli {

struct ApiConfig {
  std::string base_url{"https://www.app.qbee.io"};
  std::string email;
  std::string password;
  // Pre-issued bearer token; used when no email/password is configured.
  std::string access_token;
  bool verify_tls{true};
  int request_timeout_seconds{30};

  bool has_password_credentials() const {
    return !email.empty() && !password.empty();
  }

  friend ApiConfig tag_invoke(const boost::json::value_to_tag<ApiConfig> &,
                              const boost::json::value &jv) {
    ApiConfig cfg{};
    if (auto *obj = jv.if_object()) {
      if (auto *p = obj->if_contains("base_url"); p && p->is_string()) {
        cfg.base_url = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("email"); p && p->is_string()) {
        cfg.email = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("password"); p && p->is_string()) {
        cfg.password = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("access_token"); p && p->is_string()) {
        cfg.access_token = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("verify_tls")) {
        cfg.verify_tls = p->as_bool();
      }
      if (auto *p = obj->if_contains("request_timeout_seconds")) {
        cfg.request_timeout_seconds = p->to_number<int>();
      }
      return cfg;
    }
    throw std::runtime_error("ApiConfig is not an object");
  }

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const ApiConfig &cfg) {
    // Secrets are never written back out.
    jv = boost::json::object{
        {"base_url", cfg.base_url},
        {"email", cfg.email},
        {"verify_tls", cfg.verify_tls},
        {"request_timeout_seconds", cfg.request_timeout_seconds}};
  }
};

class IApiConfigProvider {
 public:
  virtual ~IApiConfigProvider() = default;
  virtual const ApiConfig &get() const = 0;
  virtual ApiConfig &get() = 0;
};

// api_config.json, then QBEE_BASEURL, QBEE_EMAIL (or QBEE_USERNAME),
// QBEE_PASSWORD and QBEE_ACCESS_TOKEN.
class ApiConfigProviderFile : public IApiConfigProvider {
 public:
  explicit ApiConfigProviderFile(ConfigSources &config_sources) {
    if (auto jv = config_sources.json_content("api_config")) {
      config_ = boost::json::value_to<ApiConfig>(*jv);
    }
    apply_env(config_);
  }

  static void apply_env(ApiConfig &cfg) {
    if (auto v = env_value("QBEE_BASEURL")) {
      cfg.base_url = *v;
    }
    if (auto v = env_value("QBEE_EMAIL")) {
      cfg.email = *v;
    } else if (auto u = env_value("QBEE_USERNAME")) {
      cfg.email = *u;
    }
    if (auto v = env_value("QBEE_PASSWORD")) {
      cfg.password = *v;
    }
    if (auto v = env_value("QBEE_ACCESS_TOKEN")) {
      cfg.access_token = *v;
    }
  }

  const ApiConfig &get() const override { return config_; }
  ApiConfig &get() override { return config_; }

 private:
  ApiConfig config_{};
};

}  // namespace qbeecli
