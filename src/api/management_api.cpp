#include "api/management_api.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/url.hpp>

#include <fmt/format.h>
#include <openssl/err.h>

#include "my_error_codes.hpp"

#ifndef QBEE_CLI_VERSION
#define QBEE_CLI_VERSION "dev"
#endif

namespace qbeecli::api {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace json = boost::json;
namespace urls = boost::urls;
using tcp = net::ip::tcp;

namespace {

struct BaseUrlParts {
  bool secure{true};
  std::string host;
  std::string port{"443"};
  std::string path_prefix;
  std::string host_header;
};

BaseUrlParts ParseBaseUrl(const std::string &base_url) {
  auto parsed = urls::parse_uri(base_url);
  if (!parsed) {
    throw std::runtime_error(fmt::format("invalid base_url '{}': {}", base_url,
                                         parsed.error().message()));
  }
  const auto &url = parsed.value();
  if (!url.has_authority() || url.host().empty()) {
    throw std::runtime_error(fmt::format("base_url missing host: '{}'", base_url));
  }
  BaseUrlParts parts;
  if (url.scheme() == "https") {
    parts.secure = true;
  } else if (url.scheme() == "http") {
    parts.secure = false;
    parts.port = "80";
  } else {
    throw std::runtime_error(fmt::format(
        "base_url must use http:// or https:// (got '{}')", url.scheme()));
  }
  parts.host = std::string(url.host());
  if (url.has_port()) {
    parts.port = std::string(url.port());
  }
  parts.host_header = parts.host;
  if (url.has_port()) {
    parts.host_header += ':';
    parts.host_header += parts.port;
  }
  parts.path_prefix = std::string(url.encoded_path());
  while (!parts.path_prefix.empty() && parts.path_prefix.back() == '/') {
    parts.path_prefix.pop_back();
  }
  return parts;
}

Error ApiFailure(int code, unsigned status, const std::string &body) {
  return make_error(code, fmt::format("API request failed with status {}: {}",
                                      status, ApiErrorText(body)));
}

} // namespace

class HttpManagementApi::ApiCall
    : public std::enable_shared_from_this<HttpManagementApi::ApiCall> {
 public:
  ApiCall(net::io_context &ioc, BaseUrlParts base,
          http::request<http::string_body> request, int timeout_seconds,
          bool verify_tls, HttpHandler handler)
      : base_(std::move(base)), request_(std::move(request)),
        timeout_(std::chrono::seconds(std::max(1, timeout_seconds))),
        verify_tls_(verify_tls), handler_(std::move(handler)),
        resolver_(net::make_strand(ioc)), ssl_ctx_(ssl::context::tls_client),
        stream_(net::make_strand(ioc), ssl_ctx_) {}

  void Start() {
    if (base_.secure) {
      ConfigureSsl();
    }
    resolver_.async_resolve(
        base_.host, base_.port,
        beast::bind_front_handler(&ApiCall::OnResolve, shared_from_this()));
  }

 private:
  void ConfigureSsl() {
    if (!verify_tls_) {
      stream_.set_verify_mode(ssl::verify_none);
      return;
    }
    try {
      ssl_ctx_.set_default_verify_paths();
      stream_.set_verify_mode(ssl::verify_peer);
      stream_.set_verify_callback(ssl::host_name_verification(base_.host));
    } catch (const std::exception &ex) {
      BOOST_LOG_SEV(lg, trivial::warning)
          << "API TLS verify setup failed, continuing: " << ex.what();
    }
  }

  void OnResolve(const beast::error_code &ec, tcp::resolver::results_type results) {
    if (ec) {
      Fail(my_errors::NETWORK::CONNECT_ERROR, "resolve", ec);
      return;
    }
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    beast::get_lowest_layer(stream_).async_connect(
        results, beast::bind_front_handler(&ApiCall::OnConnect, shared_from_this()));
  }

  void OnConnect(const beast::error_code &ec,
                 const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      Fail(my_errors::NETWORK::CONNECT_ERROR, "connect", ec);
      return;
    }
    if (!base_.secure) {
      DoWrite(beast::get_lowest_layer(stream_));
      return;
    }
    if (!SSL_set_tlsext_host_name(stream_.native_handle(), base_.host.c_str())) {
      beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                  net::error::get_ssl_category()};
      Fail(my_errors::NETWORK::SSL_ERROR, "set_sni", sni_error);
      return;
    }
    stream_.async_handshake(
        ssl::stream_base::client,
        beast::bind_front_handler(&ApiCall::OnTlsHandshake, shared_from_this()));
  }

  void OnTlsHandshake(const beast::error_code &ec) {
    if (ec) {
      Fail(my_errors::NETWORK::SSL_ERROR, "tls_handshake", ec);
      return;
    }
    DoWrite(stream_);
  }

  template <typename Stream> void DoWrite(Stream &stream) {
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    http::async_write(stream, request_,
                      [self = shared_from_this(), &stream](
                          const beast::error_code &ec, std::size_t) {
                        self->OnWrite(stream, ec);
                      });
  }

  template <typename Stream>
  void OnWrite(Stream &stream, const beast::error_code &ec) {
    if (ec) {
      Fail(my_errors::NETWORK::WRITE_ERROR, "write", ec);
      return;
    }
    http::async_read(stream, buffer_, response_,
                     beast::bind_front_handler(&ApiCall::OnRead, shared_from_this()));
  }

  void OnRead(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail(my_errors::NETWORK::READ_ERROR, "read", ec);
      return;
    }
    HttpResult result;
    result.status = response_.result_int();
    result.body = std::move(response_.body());
    beast::error_code ignored;
    beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both,
                                                       ignored);
    Finish({}, std::move(result));
  }

  void Fail(int code, const char *context, const beast::error_code &ec) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "API " << request_.target() << ' ' << context
        << " error: " << ec.message();
    Finish(make_error(code, fmt::format("API {} failed: {}", context, ec.message())),
           {});
  }

  void Finish(Error err, HttpResult result) {
    auto handler = std::move(handler_);
    handler_ = nullptr;
    if (handler) {
      handler(std::move(err), std::move(result));
    }
  }

  BaseUrlParts base_;
  http::request<http::string_body> request_;
  std::chrono::seconds timeout_;
  bool verify_tls_;
  HttpHandler handler_;
  tcp::resolver resolver_;
  ssl::context ssl_ctx_;
  beast::ssl_stream<beast::tcp_stream> stream_;
  beast::flat_buffer buffer_;
  http::response<http::string_body> response_;
  src::severity_logger<trivial::severity_level> lg;
};

HttpManagementApi::HttpManagementApi(IoContextManager &io_context_manager,
                                     IApiConfigProvider &config_provider)
    : ioc_(io_context_manager.ioc()), config_provider_(config_provider),
      token_(config_provider.get().access_token) {}

std::string HttpManagementApi::auth_token() const {
  std::lock_guard<std::mutex> lock(token_mutex_);
  return token_;
}

void HttpManagementApi::set_auth_token(std::string token) {
  std::lock_guard<std::mutex> lock(token_mutex_);
  token_ = std::move(token);
}

void HttpManagementApi::request(http::verb method, std::string target,
                                std::string body, bool authorized,
                                HttpHandler handler) {
  const auto &cfg = config_provider_.get();
  BaseUrlParts base;
  try {
    base = ParseBaseUrl(cfg.base_url);
  } catch (const std::exception &ex) {
    net::post(ioc_, [handler = std::move(handler), what = std::string(ex.what())]() {
      handler(make_error(my_errors::GENERAL::INVALID_ARGUMENT, what), {});
    });
    return;
  }

  http::request<http::string_body> req{method, base.path_prefix + target, 11};
  req.set(http::field::host, base.host_header);
  req.set(http::field::user_agent, std::string("qbee-cli/") + QBEE_CLI_VERSION);
  req.set(http::field::accept, "application/json");
  if (authorized) {
    req.set(http::field::authorization, "Bearer " + auth_token());
  }
  if (!body.empty()) {
    req.set(http::field::content_type, "application/json");
    req.body() = std::move(body);
  }
  req.prepare_payload();

  BOOST_LOG_SEV(lg, trivial::debug)
      << "API " << req.method_string() << ' ' << req.target();
  std::make_shared<ApiCall>(ioc_, std::move(base), std::move(req),
                            cfg.request_timeout_seconds, cfg.verify_tls,
                            std::move(handler))
      ->Start();
}

void HttpManagementApi::authorized_request(http::verb method, std::string target,
                                           HttpHandler handler) {
  request(method, target, {}, true,
          [this, method, target, handler = std::move(handler)](
              Error err, HttpResult result) mutable {
            if (err || result.status != 401 ||
                !config_provider_.get().has_password_credentials()) {
              handler(std::move(err), std::move(result));
              return;
            }
            BOOST_LOG_SEV(lg, trivial::info)
                << "API token rejected, logging in again";
            const auto &cfg = config_provider_.get();
            async_login(cfg.email, cfg.password,
                        [this, method, target, handler = std::move(handler)](
                            Error err, std::string) mutable {
                          if (err) {
                            handler(std::move(err), {});
                            return;
                          }
                          request(method, std::move(target), {}, true,
                                  std::move(handler));
                        });
          });
}

void HttpManagementApi::async_authenticate(Completion handler) {
  const auto &cfg = config_provider_.get();
  if (cfg.has_password_credentials()) {
    async_login(cfg.email, cfg.password,
                [handler = std::move(handler)](Error err, std::string) {
                  handler(std::move(err));
                });
    return;
  }
  if (!cfg.access_token.empty()) {
    set_auth_token(cfg.access_token);
    net::post(ioc_, [handler = std::move(handler)]() { handler(Error{}); });
    return;
  }
  net::post(ioc_, [handler = std::move(handler)]() {
    handler(make_error(my_errors::AUTH::MISSING_CREDENTIALS,
                       "no credentials configured: set QBEE_EMAIL and "
                       "QBEE_PASSWORD, or QBEE_ACCESS_TOKEN"));
  });
}

void HttpManagementApi::async_login(std::string email, std::string password,
                                    TokenHandler handler) {
  LoginRequest login{std::move(email), std::move(password)};
  request(http::verb::post, "/api/v2/login",
          json::serialize(json::value_from(login)), false,
          [this, handler = std::move(handler)](Error err, HttpResult result) {
            if (err) {
              handler(make_error(my_errors::AUTH::LOGIN_FAILED,
                                 "login failed: " + err.what),
                      {});
              return;
            }
            if (result.status >= 400) {
              handler(ApiFailure(my_errors::AUTH::LOGIN_FAILED, result.status,
                                 result.body),
                      {});
              return;
            }
            std::string token;
            try {
              token = ParseLoginToken(json::parse(result.body));
            } catch (const std::exception &ex) {
              handler(make_error(my_errors::AUTH::LOGIN_FAILED,
                                 fmt::format("login failed: {}", ex.what())),
                      {});
              return;
            }
            set_auth_token(token);
            BOOST_LOG_SEV(lg, trivial::info) << "API login succeeded";
            handler(Error{}, std::move(token));
          });
}

void HttpManagementApi::async_get_device_status(std::string device_id,
                                                StatusHandler handler) {
  authorized_request(
      http::verb::get, fmt::format("/api/v2/device/{}/status", device_id),
      [handler = std::move(handler)](Error err, HttpResult result) {
        if (err) {
          handler(std::move(err), {});
          return;
        }
        if (result.status >= 400) {
          handler(ApiFailure(my_errors::GENERAL::API_ERROR, result.status,
                             result.body),
                  {});
          return;
        }
        try {
          handler(Error{}, json::value_to<DeviceStatus>(json::parse(result.body)));
        } catch (const std::exception &ex) {
          handler(make_error(my_errors::GENERAL::JSON_PARSE_ERROR,
                             fmt::format("invalid device status: {}", ex.what())),
                  {});
        }
      });
}

void HttpManagementApi::async_find_devices_by_uuid(std::string uuid,
                                                   DigestsHandler handler) {
  authorized_request(
      http::verb::get, InventoryUuidQuery(uuid),
      [handler = std::move(handler)](Error err, HttpResult result) {
        if (err) {
          handler(std::move(err), {});
          return;
        }
        if (result.status >= 400) {
          handler(ApiFailure(my_errors::GENERAL::API_ERROR, result.status,
                             result.body),
                  {});
          return;
        }
        try {
          handler(Error{}, ParseInventoryDigests(json::parse(result.body)));
        } catch (const std::exception &ex) {
          handler(make_error(my_errors::GENERAL::JSON_PARSE_ERROR,
                             fmt::format("invalid inventory response: {}",
                                         ex.what())),
                  {});
        }
      });
}

} // namespace qbeecli::api
