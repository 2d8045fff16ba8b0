#include "tunnel/udp_relay.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include "transport/stream_messages.hpp"
#include "util/post_to.hpp"

namespace qbeecli {
namespace net = boost::asio;
using udp = net::ip::udp;

std::string EncodeDatagram(const std::string &payload) {
  std::string out;
  out.reserve(2 + payload.size());
  out.push_back(static_cast<char>((payload.size() >> 8) & 0xff));
  out.push_back(static_cast<char>(payload.size() & 0xff));
  out += payload;
  return out;
}

UdpRelay::UdpRelay(Strand strand, udp::socket socket,
                   transport::SessionPtr session, std::string remote_address,
                   std::chrono::steady_clock::duration idle_timeout)
    : strand_(std::move(strand)), socket_(std::move(socket)),
      session_(std::move(session)), remote_address_(std::move(remote_address)),
      idle_timeout_(idle_timeout) {}

void UdpRelay::start() {
  net::post(strand_, [self = shared_from_this()]() { self->Receive(); });
}

void UdpRelay::close() {
  net::post(strand_, [self = shared_from_this()]() {
    if (self->closed_) {
      return;
    }
    self->closed_ = true;
    boost::system::error_code ignored;
    self->socket_.close(ignored);
    for (auto &[peer, flow] : self->flows_) {
      flow->idle.cancel();
      if (flow->stream) {
        flow->stream->close();
      }
    }
    self->flows_.clear();
  });
}

udp::endpoint UdpRelay::local_endpoint() const {
  boost::system::error_code ec;
  return socket_.local_endpoint(ec);
}

void UdpRelay::Receive() {
  socket_.async_receive_from(
      net::buffer(receive_buffer_), sender_,
      net::bind_executor(strand_, [self = shared_from_this()](
                                      boost::system::error_code ec,
                                      std::size_t n) {
        if (ec) {
          if (ec != net::error::operation_aborted && !self->closed_) {
            BOOST_LOG_SEV(self->lg, trivial::warning)
                << "udp receive failed: " << ec.message();
          }
          return;
        }
        self->HandleDatagram(self->sender_,
                             std::string(self->receive_buffer_.data(), n));
        self->Receive();
      }));
}

void UdpRelay::HandleDatagram(const udp::endpoint &peer, std::string payload) {
  if (closed_) {
    return;
  }
  auto &flow = flows_[peer];
  const bool is_new = !flow;
  if (is_new) {
    flow = std::make_shared<Flow>(strand_);
    flow->last_activity = std::chrono::steady_clock::now();
    BOOST_LOG_SEV(lg, trivial::debug)
        << "new udp flow from " << peer << " to " << remote_address_;
    WatchIdle(peer, flow);
  }
  flow->last_activity = std::chrono::steady_clock::now();
  if (flow->pending.size() >= kMaxPendingDatagrams) {
    BOOST_LOG_SEV(lg, trivial::debug) << "udp flow " << peer << " backlog full";
    return;
  }
  flow->pending.push_back(EncodeDatagram(payload));
  if (is_new) {
    OpenFlow(peer, flow);
  } else {
    WriteNext(peer, flow);
  }
}

void UdpRelay::OpenFlow(const udp::endpoint &peer, FlowPtr flow) {
  session_->async_open_stream(
      transport::MessageType::udp_tunnel, remote_address_,
      PostTo(strand_, [self = shared_from_this(), peer, flow](
                          boost::system::error_code ec,
                          transport::StreamPtr stream, std::string reply) {
        if (self->closed_) {
          if (stream) {
            stream->close();
          }
          return;
        }
        if (ec) {
          BOOST_LOG_SEV(self->lg, trivial::warning)
              << "error opening udp stream to " << self->remote_address_
              << ": " << ec.message() << (reply.empty() ? "" : " ") << reply;
          self->DropFlow(peer, flow);
          return;
        }
        flow->stream = std::move(stream);
        self->ReadReply(peer, flow);
        self->WriteNext(peer, flow);
      }));
}

void UdpRelay::WriteNext(const udp::endpoint &peer, FlowPtr flow) {
  if (!flow->stream || flow->writing || flow->pending.empty()) {
    return;
  }
  flow->writing = true;
  auto frame = std::make_shared<std::string>(std::move(flow->pending.front()));
  flow->pending.pop_front();
  flow->stream->async_write(
      net::buffer(*frame),
      PostTo(strand_, [self = shared_from_this(), peer, flow, frame](
                          boost::system::error_code ec, std::size_t) {
        flow->writing = false;
        if (ec) {
          self->DropFlow(peer, flow);
          return;
        }
        self->WriteNext(peer, flow);
      }));
}

void UdpRelay::ReadReply(const udp::endpoint &peer, FlowPtr flow) {
  auto stream = flow->stream;
  transport::async_read_exactly(
      stream, 2,
      PostTo(strand_, [self = shared_from_this(), peer, flow,
                       stream](boost::system::error_code ec,
                               std::string header) {
        if (ec) {
          self->DropFlow(peer, flow);
          return;
        }
        const std::size_t len =
            (static_cast<std::size_t>(static_cast<std::uint8_t>(header[0])) << 8) |
            static_cast<std::size_t>(static_cast<std::uint8_t>(header[1]));
        transport::async_read_exactly(
            stream, len,
            PostTo(self->strand_, [self, peer, flow](boost::system::error_code ec,
                                                     std::string payload) {
              if (ec || self->closed_) {
                self->DropFlow(peer, flow);
                return;
              }
              flow->last_activity = std::chrono::steady_clock::now();
              auto datagram = std::make_shared<std::string>(std::move(payload));
              self->socket_.async_send_to(
                  net::buffer(*datagram), peer,
                  [self, datagram](boost::system::error_code ec, std::size_t) {
                    if (ec && ec != net::error::operation_aborted) {
                      BOOST_LOG_SEV(self->lg, trivial::debug)
                          << "udp send failed: " << ec.message();
                    }
                  });
              self->ReadReply(peer, flow);
            }));
      }));
}

void UdpRelay::WatchIdle(const udp::endpoint &peer, FlowPtr flow) {
  flow->idle.expires_at(flow->last_activity + idle_timeout_);
  flow->idle.async_wait(net::bind_executor(
      strand_, [self = shared_from_this(), peer,
                flow](boost::system::error_code ec) {
        if (ec || self->closed_) {
          return;
        }
        auto it = self->flows_.find(peer);
        if (it == self->flows_.end() || it->second != flow) {
          return;
        }
        if (std::chrono::steady_clock::now() - flow->last_activity <
            self->idle_timeout_) {
          self->WatchIdle(peer, flow);
          return;
        }
        BOOST_LOG_SEV(self->lg, trivial::debug)
            << "udp flow from " << peer << " idle, closing";
        self->DropFlow(peer, flow);
      }));
}

void UdpRelay::DropFlow(const udp::endpoint &peer, const FlowPtr &flow) {
  flow->idle.cancel();
  if (flow->stream) {
    flow->stream->close();
  }
  auto it = flows_.find(peer);
  if (it != flows_.end() && it->second == flow) {
    flows_.erase(it);
  }
}

}  // namespace qbeecli
