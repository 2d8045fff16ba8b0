#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

#include <boost/asio/io_context.hpp>

#include <array>
#include <chrono>
#include <memory>
#include <string>

#include "transport/local_stream.hpp"

namespace qbeecli::transport {
namespace net = boost::asio;
using namespace std::chrono_literals;

namespace {

bool NonBlocking(int fd) { return (::fcntl(fd, F_GETFL) & O_NONBLOCK) != 0; }

// Two pipes standing in for a process's stdin and stdout.
class DescriptorStreamTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_EQ(::pipe(in_.data()), 0);
    ASSERT_EQ(::pipe(out_.data()), 0);
  }

  void TearDown() override {
    for (int fd : {in_[0], in_[1], out_[0], out_[1]}) {
      ::close(fd);
    }
  }

  // Reads "hi" through the stream and writes "ok" back.
  void Exchange(DescriptorStream &stream) {
    ASSERT_EQ(::write(in_[1], "hi", 2), 2);
    std::array<char, 8> buf{};
    std::size_t got = 0;
    stream.async_read_some(net::buffer(buf),
                           [&](boost::system::error_code ec, std::size_t n) {
                             EXPECT_FALSE(ec) << ec.message();
                             got = n;
                           });
    const std::string reply = "ok";
    std::size_t written = 0;
    stream.async_write(net::buffer(reply),
                       [&](boost::system::error_code ec, std::size_t n) {
                         EXPECT_FALSE(ec) << ec.message();
                         written = n;
                       });
    ioc_.run_for(2s);
    ioc_.restart();
    EXPECT_EQ(std::string(buf.data(), got), "hi");
    EXPECT_EQ(written, 2u);
  }

  net::io_context ioc_;
  std::array<int, 2> in_{-1, -1};
  std::array<int, 2> out_{-1, -1};
};

} // namespace

TEST_F(DescriptorStreamTest, CloseRestoresBlockingMode) {
  ASSERT_FALSE(NonBlocking(in_[0]));
  ASSERT_FALSE(NonBlocking(out_[1]));
  auto stream =
      std::make_shared<DescriptorStream>(ioc_.get_executor(), in_[0], out_[1]);
  Exchange(*stream);

  stream->close();
  ioc_.run_for(1s);
  EXPECT_FALSE(NonBlocking(in_[0]));
  EXPECT_FALSE(NonBlocking(out_[1]));
}

TEST_F(DescriptorStreamTest, DestructionRestoresBlockingMode) {
  {
    auto stream = std::make_shared<DescriptorStream>(ioc_.get_executor(),
                                                     in_[0], out_[1]);
    Exchange(*stream);
  }
  EXPECT_FALSE(NonBlocking(in_[0]));
  EXPECT_FALSE(NonBlocking(out_[1]));
}

TEST_F(DescriptorStreamTest, KeepsCallerNonBlockingFlag) {
  ASSERT_EQ(::fcntl(out_[1], F_SETFL, ::fcntl(out_[1], F_GETFL) | O_NONBLOCK),
            0);
  auto stream =
      std::make_shared<DescriptorStream>(ioc_.get_executor(), in_[0], out_[1]);
  Exchange(*stream);
  stream->close();
  ioc_.run_for(1s);
  EXPECT_FALSE(NonBlocking(in_[0]));
  EXPECT_TRUE(NonBlocking(out_[1]));
}

TEST_F(DescriptorStreamTest, OriginalDescriptorsStayOpen) {
  auto stream =
      std::make_shared<DescriptorStream>(ioc_.get_executor(), in_[0], out_[1]);
  stream->close();
  ioc_.run_for(1s);
  ASSERT_EQ(::write(in_[1], "x", 1), 1);
  char c = 0;
  EXPECT_EQ(::read(in_[0], &c, 1), 1);
  EXPECT_EQ(c, 'x');
}

} // namespace qbeecli::transport
