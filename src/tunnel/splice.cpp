#include "tunnel/splice.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

namespace qbeecli {
namespace net = boost::asio;

std::shared_ptr<Splice> Splice::Start(transport::StreamPtr a,
                                      transport::StreamPtr b,
                                      Handler handler) {
  auto splice =
      std::make_shared<Splice>(std::move(a), std::move(b), std::move(handler));
  splice->a_to_b_.from = splice->a_.get();
  splice->a_to_b_.to = splice->b_.get();
  splice->b_to_a_.from = splice->b_.get();
  splice->b_to_a_.to = splice->a_.get();
  splice->Pump(splice->a_to_b_);
  splice->Pump(splice->b_to_a_);
  return splice;
}

void Splice::close() { Finish(net::error::operation_aborted); }

void Splice::Pump(Direction &dir) {
  dir.from->async_read_some(
      net::buffer(dir.buffer),
      [self = shared_from_this(), &dir](boost::system::error_code ec,
                                        std::size_t n) {
        if (ec) {
          self->Finish(ec);
          return;
        }
        dir.to->async_write(
            net::buffer(dir.buffer.data(), n),
            [self, &dir](boost::system::error_code ec, std::size_t) {
              if (ec) {
                self->Finish(ec);
                return;
              }
              self->Pump(dir);
            });
      });
}

void Splice::Finish(boost::system::error_code ec) {
  Handler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
      return;
    }
    finished_ = true;
    handler = std::move(handler_);
  }
  a_->close();
  b_->close();
  if (ec == net::error::eof) {
    ec = {};
  }
  if (handler) {
    handler(ec);
  }
}

}  // namespace qbeecli
