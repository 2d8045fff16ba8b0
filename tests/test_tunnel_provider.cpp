#include <gtest/gtest.h>

#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "broker/connection_cache.hpp"
#include "broker/tunnel_provider.hpp"
#include "fake_connector.hpp"
#include "fake_management_api.hpp"
#include "io_test_support.hpp"
#include "tunnel/device_status_resolver.hpp"

namespace qbeecli::broker {
namespace net = boost::asio;
using tcp = net::ip::tcp;
using namespace std::chrono_literals;
using testutil::FakeConnector;

namespace {

const std::string kDevice(64, 'e');

using PortResult = std::pair<Error, std::uint16_t>;

class TunnelProviderTest : public ::testing::Test {
 protected:
  void TearDown() override {
    cache_.clear();
    io_.Drain();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &acceptor : listeners_) {
      boost::system::error_code ignored;
      acceptor->close(ignored);
    }
  }

  void make_provider(FakeConnector::Script script,
                     std::chrono::milliseconds ready_timeout = 3000ms) {
    factory_ = std::make_unique<testutil::FakeConnectorFactory>(
        io_.executor(), std::move(script));
    TunnelProvider::Options options;
    options.port_ready_timeout = ready_timeout;
    options.poll_interval = 10ms;
    provider_ = std::make_shared<TunnelProvider>(io_.executor(), cache_,
                                                 resolver_, *factory_, options);
  }

  // Plays a bridge that comes up: listens on the requested local port.
  FakeConnector::Script Listening() {
    return [this](const std::string &,
                  const std::vector<RemoteAccessTarget> &targets,
                  std::shared_ptr<FakeConnector>) {
      auto acceptor = std::make_shared<tcp::acceptor>(io_.ioc());
      const tcp::endpoint endpoint(net::ip::address_v4::loopback(),
                                   static_cast<std::uint16_t>(
                                       std::stoi(targets.at(0).local_port)));
      acceptor->open(endpoint.protocol());
      acceptor->set_option(net::socket_base::reuse_address(true));
      acceptor->bind(endpoint);
      acceptor->listen();
      std::lock_guard<std::mutex> lock(mutex_);
      listeners_.push_back(acceptor);
    };
  }

  std::future<PortResult> acquire(const std::string &device_id,
                                  const std::string &port) {
    auto promise = std::make_shared<std::promise<PortResult>>();
    auto future = promise->get_future();
    provider_->acquire(device_id, port,
                       [promise](Error err, std::uint16_t local_port) {
                         promise->set_value({std::move(err), local_port});
                       });
    return future;
  }

  testutil::IoThread io_;
  testutil::FakeManagementApi api_{io_.executor()};
  DeviceStatusResolver resolver_{io_.executor(), api_};
  ConnectionCache cache_{std::chrono::seconds(300)};
  std::unique_ptr<testutil::FakeConnectorFactory> factory_;
  std::shared_ptr<TunnelProvider> provider_;
  std::mutex mutex_;
  std::vector<std::shared_ptr<tcp::acceptor>> listeners_;
};

} // namespace

TEST(PickFreePortTest, ReturnsBindablePort) {
  const auto port = PickFreePort();
  EXPECT_NE(port, 0);
  net::io_context ioc;
  tcp::acceptor acceptor(ioc);
  boost::system::error_code ec;
  acceptor.open(tcp::v4(), ec);
  acceptor.bind({net::ip::address_v4::loopback(), port}, ec);
  EXPECT_FALSE(ec) << ec.message();
}

TEST_F(TunnelProviderTest, OpensTunnelOnceThePortAccepts) {
  make_provider(Listening());
  auto future = acquire(kDevice, "80");
  auto result = testutil::WaitFor(future);
  ASSERT_TRUE(result.has_value());
  ASSERT_FALSE(result->first) << result->first;
  EXPECT_NE(result->second, 0);

  auto created = factory_->created();
  ASSERT_EQ(created.size(), 1u);
  EXPECT_EQ(created[0]->device_id(), kDevice);
  auto targets = created[0]->targets();
  ASSERT_EQ(targets.size(), 1u);
  EXPECT_EQ(targets[0].remote_address(), "localhost:80");
  EXPECT_EQ(targets[0].local_port, std::to_string(result->second));

  auto cached = cache_.get(CacheKey(kDevice, "80"));
  ASSERT_TRUE(cached.has_value());
  EXPECT_EQ(cached->local_port, result->second);
}

TEST_F(TunnelProviderTest, CachedTunnelIsReused) {
  make_provider(Listening());
  auto first_future = acquire(kDevice, "80");
  auto first = testutil::WaitFor(first_future);
  ASSERT_TRUE(first.has_value());
  auto second_future = acquire(kDevice, "80");
  auto second = testutil::WaitFor(second_future);
  ASSERT_TRUE(second.has_value());
  EXPECT_FALSE(second->first);
  EXPECT_EQ(second->second, first->second);
  EXPECT_EQ(factory_->created().size(), 1u);
}

TEST_F(TunnelProviderTest, ConcurrentRequestsShareOneAttempt) {
  make_provider(Listening());
  auto a = acquire(kDevice, "8080");
  auto b = acquire(kDevice, "8080");
  auto ra = testutil::WaitFor(a);
  auto rb = testutil::WaitFor(b);
  ASSERT_TRUE(ra.has_value());
  ASSERT_TRUE(rb.has_value());
  EXPECT_FALSE(ra->first);
  EXPECT_EQ(ra->second, rb->second);
  EXPECT_EQ(factory_->created().size(), 1u);
}

TEST_F(TunnelProviderTest, ConnectorFailureFailsTheRequest) {
  make_provider([](const std::string &, const std::vector<RemoteAccessTarget> &,
                   std::shared_ptr<FakeConnector> c) {
    c->complete(make_error(my_errors::DEVICE::REMOTE_ACCESS_UNAVAILABLE,
                           "remote access is not available"));
  });
  auto future = acquire(kDevice, "80");
  auto result = testutil::WaitFor(future);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->first.is(my_errors::DEVICE::REMOTE_ACCESS_UNAVAILABLE));
  EXPECT_EQ(result->second, 0);
  EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(TunnelProviderTest, PortThatNeverOpensTimesOut) {
  make_provider(nullptr, 200ms);
  auto future = acquire(kDevice, "80");
  auto result = testutil::WaitFor(future);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->first.is(my_errors::TUNNEL::PORT_NOT_READY));
  ASSERT_EQ(factory_->created().size(), 1u);
  EXPECT_TRUE(factory_->created()[0]->stopped());
  EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(TunnelProviderTest, ClosedTunnelLeavesTheCache) {
  make_provider(Listening());
  auto future = acquire(kDevice, "80");
  auto result = testutil::WaitFor(future);
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(cache_.size(), 1u);

  factory_->created()[0]->complete(
      make_error(my_errors::TRANSPORT::SESSION_CLOSED, "session lost"));
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (cache_.size() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(TunnelProviderTest, UuidIsMappedToDeviceId) {
  const std::string uuid = "5c1a3d6e-1f0b-4c1e-9a4b-8d2f1e3c4b5a";
  api_.set_digests(uuid, {kDevice});
  make_provider(Listening());
  auto future = acquire(uuid, "80");
  auto result = testutil::WaitFor(future);
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->first);
  EXPECT_EQ(factory_->created().at(0)->device_id(), kDevice);
  EXPECT_TRUE(cache_.get(CacheKey(uuid, "80")).has_value());
}

TEST_F(TunnelProviderTest, UnknownUuidIsNotFound) {
  make_provider(Listening());
  auto future = acquire("5c1a3d6e-1f0b-4c1e-9a4b-8d2f1e3c4b5a", "80");
  auto result = testutil::WaitFor(future);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->first.is(my_errors::DEVICE::NOT_FOUND));
  EXPECT_TRUE(factory_->created().empty());
}

} // namespace qbeecli::broker
