#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/write.hpp>

#include <memory>

#include "transport/transport.hpp"

namespace qbeecli::transport {

// IStream over a connected TCP socket. close() runs on the socket's
// executor, so it is safe to call from any thread.
class SocketStream : public IStream,
                     public std::enable_shared_from_this<SocketStream> {
 public:
  explicit SocketStream(boost::asio::ip::tcp::socket socket)
      : socket_(std::move(socket)) {}

  void async_read_some(boost::asio::mutable_buffer buffer,
                       IoHandler handler) override {
    socket_.async_read_some(buffer, std::move(handler));
  }

  void async_write(boost::asio::const_buffer buffer,
                   IoHandler handler) override {
    boost::asio::async_write(socket_, buffer, std::move(handler));
  }

  void close() override {
    boost::asio::post(socket_.get_executor(), [self = shared_from_this()]() {
      boost::system::error_code ignored;
      self->socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both,
                             ignored);
      self->socket_.close(ignored);
    });
  }

 private:
  boost::asio::ip::tcp::socket socket_;
};

// IStream reading one descriptor and writing another: process stdin and
// stdout for stdio tunnels and terminal sessions. The descriptors are
// duplicated, closing the stream never closes fds 0 and 1. The duplicates
// share the file status flags with the originals, so the flags saved at
// construction (O_NONBLOCK in particular) are put back on close.
class DescriptorStream : public IStream,
                         public std::enable_shared_from_this<DescriptorStream> {
 public:
  DescriptorStream(boost::asio::any_io_executor executor, int in_fd,
                   int out_fd);
  ~DescriptorStream() override;

  DescriptorStream(const DescriptorStream &) = delete;
  DescriptorStream &operator=(const DescriptorStream &) = delete;

  void async_read_some(boost::asio::mutable_buffer buffer,
                       IoHandler handler) override {
    in_.async_read_some(buffer, std::move(handler));
  }

  void async_write(boost::asio::const_buffer buffer,
                   IoHandler handler) override {
    boost::asio::async_write(out_, buffer, std::move(handler));
  }

  void close() override {
    boost::asio::post(in_.get_executor(), [self = shared_from_this()]() {
      self->CloseAndRestore();
    });
  }

 private:
  void CloseAndRestore();

  boost::asio::posix::stream_descriptor in_;
  boost::asio::posix::stream_descriptor out_;
  int in_fd_;
  int out_fd_;
  int in_flags_{-1};
  int out_flags_{-1};
  bool restored_{false};
};

}  // namespace qbeecli::transport
