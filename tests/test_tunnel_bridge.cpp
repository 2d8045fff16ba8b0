#include <gtest/gtest.h>

#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <sys/resource.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "customio/console_output.hpp"
#include "io_test_support.hpp"
#include "loopback_transport.hpp"
#include "transport/stream_messages.hpp"
#include "tunnel/tunnel_bridge.hpp"
#include "tunnel/udp_relay.hpp"

namespace qbeecli {
namespace net = boost::asio;
using tcp = net::ip::tcp;
using udp = net::ip::udp;
using namespace std::chrono_literals;
using transport::MessageType;
using transport::StreamPtr;

namespace {

const std::string kDevice(64, 'd');

RemoteAccessTarget Target(const std::string &text) {
  return ParseRemoteAccessTarget(text);
}

std::string EchoOverTcp(std::uint16_t port, const std::string &msg) {
  net::io_context cio;
  tcp::socket socket(cio);
  if (!testutil::ConnectWithRetry(socket, port)) {
    return "<connect failed>";
  }
  net::write(socket, net::buffer(msg));
  std::string got(msg.size(), '\0');
  boost::system::error_code result = net::error::timed_out;
  net::async_read(socket, net::buffer(got),
                  [&](boost::system::error_code ec, std::size_t) {
                    result = ec;
                  });
  cio.run_for(3s);
  if (result) {
    return "<read failed: " + result.message() + ">";
  }
  return got;
}

// Sends msg to the relay on port until a reply arrives; the relay socket
// may not be bound yet on the first attempts.
std::string QueryOverUdp(net::io_context &cio, udp::socket &socket,
                         std::uint16_t port, const std::string &msg) {
  const udp::endpoint relay(net::ip::make_address("127.0.0.1"), port);
  std::array<char, 128> buffer{};
  udp::endpoint from;
  std::string reply;
  for (int attempt = 0; attempt < 30 && reply.empty(); ++attempt) {
    socket.send_to(net::buffer(msg), relay);
    socket.async_receive_from(net::buffer(buffer), from,
                              [&](boost::system::error_code ec, std::size_t n) {
                                if (!ec) {
                                  reply.assign(buffer.data(), n);
                                }
                              });
    cio.run_for(100ms);
    if (reply.empty()) {
      socket.cancel();
      cio.run();
    }
    cio.restart();
  }
  return reply;
}

// Device side of a udp_tunnel stream: answers every framed datagram with
// "re:" + payload. ended, when given, is set once the stream ends.
void UdpEchoLoop(StreamPtr stream,
                 std::shared_ptr<std::promise<bool>> ended = nullptr) {
  transport::async_read_exactly(
      stream, 2,
      [stream, ended](boost::system::error_code ec, std::string header) {
        if (ec) {
          if (ended) {
            ended->set_value(true);
          }
          return;
        }
        const std::size_t len =
            (static_cast<std::uint8_t>(header[0]) << 8) |
            static_cast<std::uint8_t>(header[1]);
        transport::async_read_exactly(
            stream, len,
            [stream, ended](boost::system::error_code ec,
                            std::string payload) {
              if (ec) {
                if (ended) {
                  ended->set_value(true);
                }
                return;
              }
              auto frame =
                  std::make_shared<std::string>(EncodeDatagram("re:" + payload));
              stream->async_write(
                  net::buffer(*frame),
                  [stream, frame, ended](boost::system::error_code ec,
                                         std::size_t) {
                    if (!ec) {
                      UdpEchoLoop(stream, ended);
                    } else if (ended) {
                      ended->set_value(true);
                    }
                  });
            });
      });
}

// Lowers the soft descriptor limit for its lifetime.
class DescriptorLimit {
 public:
  explicit DescriptorLimit(rlim_t soft) {
    ::getrlimit(RLIMIT_NOFILE, &saved_);
    rlimit lowered = saved_;
    lowered.rlim_cur = soft;
    ok_ = ::setrlimit(RLIMIT_NOFILE, &lowered) == 0;
  }
  ~DescriptorLimit() { ::setrlimit(RLIMIT_NOFILE, &saved_); }

  bool ok() const { return ok_; }

 private:
  rlimit saved_{};
  bool ok_{false};
};

std::chrono::microseconds CpuTime() {
  rusage usage{};
  ::getrusage(RUSAGE_SELF, &usage);
  const auto to_us = [](const timeval &tv) {
    return std::chrono::seconds(tv.tv_sec) +
           std::chrono::microseconds(tv.tv_usec);
  };
  return to_us(usage.ru_utime) + to_us(usage.ru_stime);
}

class TunnelBridgeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    session_ = std::make_shared<testutil::LoopbackSession>(io_.executor());
    bridge_ = std::make_shared<TunnelBridge>(io_.executor(), session_,
                                             kDevice, output_);
  }

  void TearDown() override {
    bridge_->stop();
    if (done_.valid()) {
      testutil::WaitFor(done_);
    }
    io_.Drain();
  }

  void start(std::vector<RemoteAccessTarget> targets) {
    auto promise = std::make_shared<std::promise<Error>>();
    done_ = promise->get_future();
    bridge_->start(std::move(targets),
                   [promise](Error err) { promise->set_value(std::move(err)); });
  }

  std::optional<Error> wait() { return testutil::WaitFor(done_); }

  testutil::IoThread io_;
  std::ostringstream console_;
  customio::ConsoleOutput output_{customio::ConsoleOutput::kInfo, console_};
  std::shared_ptr<testutil::LoopbackSession> session_;
  std::shared_ptr<TunnelBridge> bridge_;
  std::future<Error> done_;
};

} // namespace

TEST(DatagramFramingTest, TwoByteBigEndianLength) {
  EXPECT_EQ(EncodeDatagram("abc"), std::string("\x00\x03" "abc", 5));
  EXPECT_EQ(EncodeDatagram(std::string(300, 'x')).substr(0, 2),
            std::string("\x01\x2c", 2));
  EXPECT_EQ(EncodeDatagram(""), std::string("\x00\x00", 2));
}

TEST_F(TunnelBridgeTest, TcpConnectionsAreSplicedToTunnelStreams) {
  session_->set_open_behaviour(
      [](const testutil::LoopbackSession::OpenedStream &opened,
         std::string &) -> boost::system::error_code {
        testutil::EchoLoop(opened.device_end);
        return {};
      });
  const auto port = testutil::FreeTcpPort();
  start({Target("127.0.0.1:" + std::to_string(port) + ":localhost:8080")});

  EXPECT_EQ(EchoOverTcp(port, "hello device"), "hello device");
  EXPECT_EQ(EchoOverTcp(port, "second connection"), "second connection");

  auto opened = session_->opened();
  ASSERT_EQ(opened.size(), 2u);
  EXPECT_EQ(opened[0].type, MessageType::tcp_tunnel);
  EXPECT_EQ(opened[0].payload, "localhost:8080");

  bridge_->stop();
  auto err = wait();
  ASSERT_TRUE(err.has_value());
  EXPECT_FALSE(*err) << *err;
  EXPECT_NE(console_.str().find("Tunneling tcp 127.0.0.1:" +
                                std::to_string(port) + " to localhost:8080"),
            std::string::npos);
}

TEST_F(TunnelBridgeTest, FailingAcceptBacksOffAndRecovers) {
  session_->set_open_behaviour(
      [](const testutil::LoopbackSession::OpenedStream &opened,
         std::string &) -> boost::system::error_code {
        testutil::EchoLoop(opened.device_end);
        return {};
      });
  const auto port = testutil::FreeTcpPort();
  net::io_context cio;
  tcp::socket client(cio);
  client.open(tcp::v4());
  // Every descriptor below spare is taken; the listener gets spare and the
  // accepted connection finds none left.
  const int spare = ::dup(client.native_handle());
  ASSERT_GE(spare, 0);
  std::optional<DescriptorLimit> limit;
  limit.emplace(static_cast<rlim_t>(spare) + 1);
  ASSERT_TRUE(limit->ok());
  ::close(spare);
  start({Target("127.0.0.1:" + std::to_string(port) + ":localhost:22")});
  ASSERT_TRUE(testutil::ConnectWithRetry(client, port));

  const auto cpu_before = CpuTime();
  std::this_thread::sleep_for(500ms);
  const auto spent = CpuTime() - cpu_before;
  EXPECT_LT(spent, std::chrono::microseconds(250ms)) << spent.count();
  limit.reset();

  net::write(client, net::buffer(std::string("ping")));
  std::string got(4, '\0');
  boost::system::error_code result = net::error::timed_out;
  net::async_read(client, net::buffer(got),
                  [&](boost::system::error_code ec, std::size_t) {
                    result = ec;
                  });
  cio.run_for(3s);
  EXPECT_FALSE(result) << result.message();
  EXPECT_EQ(got, "ping");
  EXPECT_EQ(done_.wait_for(0ms), std::future_status::timeout);
}

TEST_F(TunnelBridgeTest, RejectedStreamClosesOnlyThatConnection) {
  session_->set_open_behaviour(
      [](const testutil::LoopbackSession::OpenedStream &,
         std::string &reply) -> boost::system::error_code {
        reply = "connection refused";
        return my_errors::make_error_code(my_errors::TRANSPORT::REJECTED);
      });
  const auto port = testutil::FreeTcpPort();
  start({Target("127.0.0.1:" + std::to_string(port) + ":localhost:9")});

  net::io_context cio;
  tcp::socket socket(cio);
  ASSERT_TRUE(testutil::ConnectWithRetry(socket, port));
  char byte = 0;
  boost::system::error_code result = net::error::timed_out;
  net::async_read(socket, net::buffer(&byte, 1),
                  [&](boost::system::error_code ec, std::size_t) {
                    result = ec;
                  });
  cio.run_for(3s);
  EXPECT_EQ(result, net::error::eof);

  EXPECT_EQ(done_.wait_for(100ms), std::future_status::timeout);
}

TEST_F(TunnelBridgeTest, UdpDatagramsTravelFramed) {
  session_->set_open_behaviour(
      [](const testutil::LoopbackSession::OpenedStream &opened,
         std::string &) -> boost::system::error_code {
        UdpEchoLoop(opened.device_end);
        return {};
      });
  const auto port = testutil::FreeUdpPort();
  start({Target("127.0.0.1:" + std::to_string(port) + ":dns:53/udp")});

  net::io_context cio;
  udp::socket socket(cio, udp::endpoint(udp::v4(), 0));
  EXPECT_EQ(QueryOverUdp(cio, socket, port, "query"), "re:query");

  auto opened = session_->opened();
  ASSERT_FALSE(opened.empty());
  EXPECT_EQ(opened[0].type, MessageType::udp_tunnel);
  EXPECT_EQ(opened[0].payload, "dns:53");
}

TEST_F(TunnelBridgeTest, QuietUdpFlowIsClosed) {
  std::mutex mutex;
  std::vector<std::future<bool>> ended;
  session_->set_open_behaviour(
      [&](const testutil::LoopbackSession::OpenedStream &opened,
          std::string &) -> boost::system::error_code {
        auto promise = std::make_shared<std::promise<bool>>();
        {
          std::lock_guard<std::mutex> lock(mutex);
          ended.push_back(promise->get_future());
        }
        UdpEchoLoop(opened.device_end, promise);
        return {};
      });
  bridge_->set_udp_idle_timeout(300ms);
  const auto port = testutil::FreeUdpPort();
  start({Target("127.0.0.1:" + std::to_string(port) + ":dns:53/udp")});

  net::io_context cio;
  udp::socket socket(cio, udp::endpoint(udp::v4(), 0));
  ASSERT_EQ(QueryOverUdp(cio, socket, port, "first"), "re:first");
  std::future<bool> first_ended;
  {
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(ended.size(), 1u);
    first_ended = std::move(ended[0]);
  }
  // Traffic inside the timeout keeps the flow on the same stream.
  std::this_thread::sleep_for(150ms);
  ASSERT_EQ(QueryOverUdp(cio, socket, port, "again"), "re:again");
  EXPECT_EQ(first_ended.wait_for(100ms), std::future_status::timeout);
  EXPECT_EQ(session_->opened().size(), 1u);

  auto closed = testutil::WaitFor(first_ended, 3000ms);
  ASSERT_TRUE(closed.has_value());
  EXPECT_TRUE(*closed);

  // The peer's next datagram opens a fresh stream.
  EXPECT_EQ(QueryOverUdp(cio, socket, port, "later"), "re:later");
  EXPECT_EQ(session_->opened().size(), 2u);
}

TEST_F(TunnelBridgeTest, StdioTargetUsesSingleStream) {
  session_->set_open_behaviour(
      [](const testutil::LoopbackSession::OpenedStream &opened,
         std::string &) -> boost::system::error_code {
        testutil::EchoLoop(opened.device_end);
        return {};
      });
  auto [bridge_end, user_end] = testutil::MakeStreamPair(io_.executor());
  bridge_->set_stdio_stream(bridge_end);
  start({Target("stdio:localhost:22")});

  std::promise<std::string> echoed;
  auto buffer = std::make_shared<std::string>(4, '\0');
  auto message = std::make_shared<std::string>("ping");
  user_end->async_write(net::buffer(*message),
                        [message](boost::system::error_code, std::size_t) {});
  transport::async_read_exactly(
      user_end, 4, [&echoed](boost::system::error_code ec, std::string data) {
        echoed.set_value(ec ? "<" + ec.message() + ">" : data);
      });
  auto echoed_future = echoed.get_future();
  auto got = testutil::WaitFor(echoed_future);
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(*got, "ping");

  // Closing the local side ends the tunnel cleanly.
  user_end->close();
  auto err = wait();
  ASSERT_TRUE(err.has_value());
  EXPECT_FALSE(*err) << *err;
  ASSERT_EQ(session_->opened().size(), 1u);
  EXPECT_EQ(session_->opened()[0].payload, "localhost:22");
}

TEST_F(TunnelBridgeTest, StdioOpenFailureIsReported) {
  session_->set_open_behaviour(
      [](const testutil::LoopbackSession::OpenedStream &,
         std::string &reply) -> boost::system::error_code {
        reply = "no route";
        return my_errors::make_error_code(my_errors::TRANSPORT::REJECTED);
      });
  auto [bridge_end, user_end] = testutil::MakeStreamPair(io_.executor());
  bridge_->set_stdio_stream(bridge_end);
  start({Target("stdio:localhost:22")});

  auto err = wait();
  ASSERT_TRUE(err.has_value());
  EXPECT_TRUE(err->is(my_errors::TRANSPORT::STREAM_OPEN_FAILED));
  EXPECT_EQ(err->what, "error opening stream: no route");
}

TEST_F(TunnelBridgeTest, BindFailureFailsStart) {
  net::io_context other;
  tcp::acceptor taken(other, {net::ip::make_address("127.0.0.1"), 0});
  const auto port = taken.local_endpoint().port();

  start({Target("127.0.0.1:" + std::to_string(port) + ":localhost:80")});
  auto err = wait();
  ASSERT_TRUE(err.has_value());
  EXPECT_TRUE(err->is(my_errors::TUNNEL::BIND_FAILED));
  EXPECT_EQ(err->what.rfind("error opening TCP tunnel: listen tcp 127.0.0.1:" +
                                std::to_string(port),
                            0),
            0u);
}

TEST_F(TunnelBridgeTest, SessionFailureEndsTheBridge) {
  const auto port = testutil::FreeTcpPort();
  start({Target("127.0.0.1:" + std::to_string(port) + ":localhost:80")});
  session_->Fail(net::error::connection_reset);

  auto err = wait();
  ASSERT_TRUE(err.has_value());
  EXPECT_TRUE(err->is(my_errors::TRANSPORT::SESSION_CLOSED));
  EXPECT_EQ(classify(*err), ErrorKind::transport);

  // The listener is gone with the bridge.
  net::io_context cio;
  tcp::socket socket(cio);
  EXPECT_FALSE(testutil::ConnectWithRetry(socket, port, 200ms));
}

TEST_F(TunnelBridgeTest, MixedStdioIsRejected) {
  RemoteAccessTarget stdio = Target("stdio:localhost:22");
  RemoteAccessTarget tcp_target = Target("8080:localhost:80");
  start({stdio, tcp_target});
  auto err = wait();
  ASSERT_TRUE(err.has_value());
  EXPECT_TRUE(err->is(my_errors::TARGET::STDIO_NOT_EXCLUSIVE));
}

} // namespace qbeecli
