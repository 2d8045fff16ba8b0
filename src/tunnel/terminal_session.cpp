#include "tunnel/terminal_session.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/json.hpp>

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "transport/pty_messages.hpp"
#include "transport/stream_messages.hpp"
#include "util/post_to.hpp"

namespace qbeecli {
namespace net = boost::asio;
namespace json = boost::json;

TerminalSession::TerminalSession(net::any_io_executor executor,
                                 transport::SessionPtr session,
                                 ITerminal &terminal,
                                 IResizeWatcher &resize_watcher,
                                 customio::ConsoleOutput &output)
    : strand_(net::make_strand(executor)), session_(std::move(session)),
      terminal_(terminal), resize_watcher_(resize_watcher), output_(output) {}

void TerminalSession::start(std::string command,
                            std::vector<std::string> command_args,
                            Completion handler) {
  net::post(strand_, [self = shared_from_this(), command = std::move(command),
                      command_args = std::move(command_args),
                      handler = std::move(handler)]() mutable {
    self->handler_ = std::move(handler);
    if (self->finished_) {
      auto h = std::move(self->handler_);
      h(Error{});
      return;
    }
    self->DoStart(std::move(command), std::move(command_args));
  });
}

void TerminalSession::stop() {
  net::post(strand_, [self = shared_from_this()]() { self->Finish(Error{}); });
}

void TerminalSession::DoStart(std::string command,
                              std::vector<std::string> command_args) {
  transport::PTYCommand initial;
  try {
    raw_mode_ = std::make_unique<TerminalRawMode>(terminal_);
  } catch (const boost::system::system_error &ex) {
    Finish(make_error(my_errors::TUNNEL::TERMINAL_ERROR,
                      fmt::format("terminal make raw: {}", ex.what())));
    return;
  }
  try {
    last_size_ = terminal_.size();
  } catch (const boost::system::system_error &ex) {
    Finish(make_error(my_errors::TUNNEL::TERMINAL_ERROR,
                      fmt::format("terminal get size: {}", ex.what())));
    return;
  }
  initial.cols = last_size_.cols;
  initial.rows = last_size_.rows;
  initial.command = std::move(command);
  initial.command_args = std::move(command_args);

  session_->async_open_stream(
      transport::MessageType::pty, json::serialize(json::value_from(initial)),
      PostTo(strand_, [self = shared_from_this()](
                          boost::system::error_code ec,
                          transport::StreamPtr stream, std::string reply) {
        if (self->finished_) {
          if (stream) {
            stream->close();
          }
          return;
        }
        if (ec) {
          self->Finish(make_error(
              my_errors::TRANSPORT::STREAM_OPEN_FAILED,
              fmt::format("error opening shell stream: {}",
                          reply.empty() ? ec.message() : reply)));
          return;
        }
        self->OnPtyOpened(std::move(stream), std::move(reply));
      }));
}

void TerminalSession::OnPtyOpened(transport::StreamPtr pty,
                                  std::string session_id) {
  pty_session_id_ = std::move(session_id);
  BOOST_LOG_SEV(lg, trivial::info) << "pty session " << pty_session_id_
                                   << " opened";
  transport::StreamPtr io;
  try {
    io = terminal_.open_io(strand_);
  } catch (const boost::system::system_error &ex) {
    pty->close();
    Finish(make_error(my_errors::TUNNEL::TERMINAL_ERROR,
                      fmt::format("terminal io: {}", ex.what())));
    return;
  }
  splice_ = Splice::Start(
      std::move(io), std::move(pty),
      PostTo(strand_, [self = shared_from_this()](boost::system::error_code ec) {
        if (ec && ec != net::error::operation_aborted) {
          self->Finish(make_error(ec, fmt::format("terminal session: {}",
                                                  ec.message())));
          return;
        }
        self->Finish(Error{});
      }));
  resize_watcher_.watch(PostTo(
      strand_, [self = shared_from_this()](TerminalSize size) {
        self->OnResize(size);
      }));
}

void TerminalSession::OnResize(TerminalSize size) {
  if (finished_ || resize_failed_) {
    return;
  }
  if (resizing_) {
    queued_size_ = size;
    return;
  }
  if (size == last_size_) {
    return;
  }
  SendResize(size);
}

void TerminalSession::SendResize(TerminalSize size) {
  resizing_ = true;
  last_size_ = size;
  transport::PTYCommand cmd;
  cmd.session_id = pty_session_id_;
  cmd.cols = size.cols;
  cmd.rows = size.rows;
  auto payload = json::serialize(json::value_from(cmd));

  session_->async_open_plain_stream(PostTo(
      strand_, [self = shared_from_this(), payload = std::move(payload)](
                   boost::system::error_code ec, transport::StreamPtr stream) {
        if (ec) {
          self->ResizeDone(make_error(
              my_errors::TRANSPORT::STREAM_OPEN_FAILED,
              fmt::format("error opening shell stream: {}", ec.message())));
          return;
        }
        transport::async_write_message(
            stream, transport::MessageType::pty_command, payload,
            PostTo(self->strand_, [self, stream](boost::system::error_code ec) {
              if (ec) {
                stream->close();
                self->ResizeDone(make_error(
                    ec, fmt::format("error writing window resize command: {}",
                                    ec.message())));
                return;
              }
              transport::async_expect_ok(
                  stream,
                  PostTo(self->strand_, [self, stream](
                                            boost::system::error_code ec,
                                            std::string reply) {
                    stream->close();
                    if (ec) {
                      self->ResizeDone(make_error(
                          ec, fmt::format("error resizing window: {}",
                                          reply.empty() ? ec.message()
                                                        : reply)));
                      return;
                    }
                    self->ResizeDone(Error{});
                  }));
            }));
      }));
}

void TerminalSession::ResizeDone(Error err) {
  resizing_ = false;
  if (finished_) {
    return;
  }
  if (err) {
    // The shell keeps running with its previous size.
    resize_failed_ = true;
    output_.error() << err.what;
    BOOST_LOG_SEV(lg, trivial::warning) << err.what;
    resize_watcher_.stop();
    return;
  }
  if (queued_size_) {
    const auto next = *queued_size_;
    queued_size_.reset();
    OnResize(next);
  }
}

void TerminalSession::Finish(Error err) {
  if (finished_) {
    return;
  }
  finished_ = true;
  resize_watcher_.stop();
  if (splice_) {
    splice_->close();
  }
  // Restores the terminal before anything is reported.
  raw_mode_.reset();
  if (err) {
    BOOST_LOG_SEV(lg, trivial::warning) << "terminal session ended: " << err.what;
  }
  if (handler_) {
    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(std::move(err));
  }
}

}  // namespace qbeecli
