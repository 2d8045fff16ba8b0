#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/beast/http/verb.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "api/api_messages.hpp"
#include "conf/api_config.hpp"
#include "qbee_error.hpp"
#include "util/io_context_manager.hpp"
#include "util/my_logging.hpp"

namespace qbeecli::api {

// The slice of the management REST API the tunnel code consumes.
class IManagementApi {
 public:
  using StatusHandler = std::function<void(Error, DeviceStatus)>;
  using DigestsHandler = std::function<void(Error, std::vector<std::string>)>;
  using TokenHandler = std::function<void(Error, std::string)>;

  virtual ~IManagementApi() = default;

  // Obtains a bearer token from the configured credentials: email and
  // password login when present, otherwise the configured access token.
  virtual void async_authenticate(Completion handler) = 0;
  virtual void async_login(std::string email, std::string password,
                           TokenHandler handler) = 0;
  virtual void async_get_device_status(std::string device_id,
                                       StatusHandler handler) = 0;
  // Public key digests of every device whose UUID matches.
  virtual void async_find_devices_by_uuid(std::string uuid,
                                          DigestsHandler handler) = 0;
  virtual std::string auth_token() const = 0;
  virtual void set_auth_token(std::string token) = 0;
};

// Beast HTTP(S) client for the management API. A request answered with
// 401 triggers one re-login (password credentials only) and a retry.
// Lives as long as the io context that runs its calls.
class HttpManagementApi : public IManagementApi {
 public:
  HttpManagementApi(IoContextManager &io_context_manager,
                    IApiConfigProvider &config_provider);

  void async_authenticate(Completion handler) override;
  void async_login(std::string email, std::string password,
                   TokenHandler handler) override;
  void async_get_device_status(std::string device_id,
                               StatusHandler handler) override;
  void async_find_devices_by_uuid(std::string uuid,
                                  DigestsHandler handler) override;
  std::string auth_token() const override;
  void set_auth_token(std::string token) override;

  struct HttpResult {
    unsigned status{0};
    std::string body;
  };
  using HttpHandler = std::function<void(Error, HttpResult)>;

 private:
  class ApiCall;

  void request(boost::beast::http::verb method, std::string target,
               std::string body, bool authorized, HttpHandler handler);
  // request() plus one re-login and retry on 401.
  void authorized_request(boost::beast::http::verb method, std::string target,
                          HttpHandler handler);

  boost::asio::io_context &ioc_;
  IApiConfigProvider &config_provider_;
  mutable std::mutex token_mutex_;
  std::string token_;
  src::severity_logger<trivial::severity_level> lg;
};

}  // namespace qbeecli::api
