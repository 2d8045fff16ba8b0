#include <gtest/gtest.h>

#include <boost/json.hpp>

#include <future>
#include <sstream>
#include <string>

#include "customio/console_output.hpp"
#include "fake_terminal.hpp"
#include "io_test_support.hpp"
#include "loopback_transport.hpp"
#include "transport/stream_messages.hpp"
#include "tunnel/terminal_session.hpp"

namespace qbeecli {
namespace net = boost::asio;
namespace json = boost::json;
using namespace std::chrono_literals;
using transport::MessageType;
using transport::StreamPtr;

namespace {

using Opened = testutil::LoopbackSession::OpenedStream;

class TerminalSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    session_ = std::make_shared<testutil::LoopbackSession>(io_.executor());
    terminal_session_ = std::make_shared<TerminalSession>(
        io_.executor(), session_, terminal_, watcher_, output_);
  }

  void TearDown() override {
    terminal_session_->stop();
    if (done_.valid()) {
      testutil::WaitFor(done_);
    }
    io_.Drain();
  }

  void AcceptPty(const std::string &session_id) {
    session_->set_open_behaviour(
        [session_id](const Opened &opened,
                     std::string &reply) -> boost::system::error_code {
          testutil::EchoLoop(opened.device_end);
          reply = session_id;
          return {};
        });
  }

  void start(std::string command = {}, std::vector<std::string> args = {}) {
    auto promise = std::make_shared<std::promise<Error>>();
    done_ = promise->get_future();
    terminal_session_->start(
        std::move(command), std::move(args),
        [promise](Error err) { promise->set_value(std::move(err)); });
  }

  std::optional<Error> wait() { return testutil::WaitFor(done_); }

  testutil::IoThread io_;
  std::ostringstream console_;
  customio::ConsoleOutput output_{customio::ConsoleOutput::kInfo, console_};
  testutil::FakeTerminal terminal_;
  testutil::ManualResizeWatcher watcher_;
  std::shared_ptr<testutil::LoopbackSession> session_;
  std::shared_ptr<TerminalSession> terminal_session_;
  std::future<Error> done_;
};

} // namespace

TEST_F(TerminalSessionTest, OpensPtyWithSizeAndCommand) {
  AcceptPty("pty-1");
  terminal_.set_size({132, 43});
  start("top", {"-b"});
  ASSERT_TRUE(watcher_.wait_watching());

  auto opened = session_->opened();
  ASSERT_EQ(opened.size(), 1u);
  EXPECT_EQ(opened[0].type, MessageType::pty);
  auto payload = json::parse(opened[0].payload).as_object();
  EXPECT_EQ(payload.at("type"), "resize");
  EXPECT_EQ(payload.at("session_id"), "");
  EXPECT_EQ(payload.at("cols").to_number<int>(), 132);
  EXPECT_EQ(payload.at("rows").to_number<int>(), 43);
  EXPECT_EQ(payload.at("command"), "top");
  EXPECT_EQ(payload.at("command_args").as_array().size(), 1u);
  EXPECT_EQ(terminal_.raw_calls(), 1);
}

TEST_F(TerminalSessionTest, CopiesIoAndEndsCleanlyWhenRemoteCloses) {
  Opened pty;
  std::mutex pty_mutex;
  session_->set_open_behaviour(
      [&](const Opened &opened, std::string &reply) -> boost::system::error_code {
        std::lock_guard<std::mutex> lock(pty_mutex);
        pty = opened;
        reply = "pty-2";
        return {};
      });
  start();
  ASSERT_TRUE(watcher_.wait_watching());
  auto user = terminal_.user_end();
  ASSERT_TRUE(user);

  std::promise<std::string> typed;
  auto typed_future = typed.get_future();
  StreamPtr device_end;
  {
    std::lock_guard<std::mutex> lock(pty_mutex);
    device_end = pty.device_end;
  }
  transport::async_read_exactly(
      device_end, 3, [&typed](boost::system::error_code ec, std::string data) {
        typed.set_value(ec ? "<" + ec.message() + ">" : data);
      });
  auto keys = std::make_shared<std::string>("ls\r");
  user->async_write(net::buffer(*keys),
                    [keys](boost::system::error_code, std::size_t) {});
  auto got = testutil::WaitFor(typed_future);
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(*got, "ls\r");

  std::promise<std::string> shown;
  auto shown_future = shown.get_future();
  transport::async_read_exactly(
      user, 6, [&shown](boost::system::error_code ec, std::string data) {
        shown.set_value(ec ? "<" + ec.message() + ">" : data);
      });
  auto screen = std::make_shared<std::string>("a.txt\n");
  device_end->async_write(net::buffer(*screen),
                          [screen](boost::system::error_code, std::size_t) {});
  auto output = testutil::WaitFor(shown_future);
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(*output, "a.txt\n");

  device_end->close();
  auto err = wait();
  ASSERT_TRUE(err.has_value());
  EXPECT_FALSE(*err) << *err;
  EXPECT_EQ(terminal_.restore_calls(), 1);
  EXPECT_TRUE(watcher_.wait_stopped());
}

TEST_F(TerminalSessionTest, ResizeIsSentOnCommandStream) {
  AcceptPty("pty-3");
  std::promise<std::pair<MessageType, std::string>> command;
  auto command_future = command.get_future();
  session_->set_plain_behaviour([&command](StreamPtr device_end) {
    testutil::AnswerCommand(device_end,
                            [&command](MessageType type, std::string payload) {
                              command.set_value({type, std::move(payload)});
                            });
  });
  start();
  ASSERT_TRUE(watcher_.wait_watching());

  watcher_.fire({100, 30});
  auto got = testutil::WaitFor(command_future);
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->first, MessageType::pty_command);
  auto payload = json::parse(got->second).as_object();
  EXPECT_EQ(payload.at("type"), "resize");
  EXPECT_EQ(payload.at("session_id"), "pty-3");
  EXPECT_EQ(payload.at("cols").to_number<int>(), 100);
  EXPECT_EQ(payload.at("rows").to_number<int>(), 30);
  EXPECT_EQ(terminal_session_->pty_session_id(), "pty-3");
}

TEST_F(TerminalSessionTest, UnchangedSizeSendsNothing) {
  AcceptPty("pty-4");
  terminal_.set_size({80, 24});
  start();
  ASSERT_TRUE(watcher_.wait_watching());
  watcher_.fire({80, 24});
  io_.Drain();
  EXPECT_TRUE(session_->plain_streams().empty());
}

TEST_F(TerminalSessionTest, RefusedResizeIsReportedAndStopsWatching) {
  AcceptPty("pty-5");
  session_->set_plain_behaviour([](StreamPtr device_end) {
    testutil::AnswerCommand(
        device_end, [](MessageType, std::string) {}, true);
  });
  start();
  ASSERT_TRUE(watcher_.wait_watching());
  watcher_.fire({120, 40});

  ASSERT_TRUE(watcher_.wait_stopped());
  io_.Drain();
  EXPECT_NE(console_.str().find("error resizing window: resize refused"),
            std::string::npos);
  // The shell itself keeps running.
  EXPECT_EQ(done_.wait_for(50ms), std::future_status::timeout);
}

TEST_F(TerminalSessionTest, RejectedPtyRestoresTerminal) {
  session_->set_open_behaviour(
      [](const Opened &, std::string &reply) -> boost::system::error_code {
        reply = "no shell available";
        return my_errors::make_error_code(my_errors::TRANSPORT::REJECTED);
      });
  start();
  auto err = wait();
  ASSERT_TRUE(err.has_value());
  EXPECT_TRUE(err->is(my_errors::TRANSPORT::STREAM_OPEN_FAILED));
  EXPECT_EQ(err->what, "error opening shell stream: no shell available");
  EXPECT_EQ(terminal_.raw_calls(), 1);
  EXPECT_EQ(terminal_.restore_calls(), 1);
}

TEST_F(TerminalSessionTest, NoTerminalFailsBeforeOpeningAnything) {
  terminal_.fail_make_raw();
  start();
  auto err = wait();
  ASSERT_TRUE(err.has_value());
  EXPECT_TRUE(err->is(my_errors::TUNNEL::TERMINAL_ERROR));
  EXPECT_TRUE(session_->opened().empty());
  EXPECT_EQ(terminal_.restore_calls(), 0);
}

TEST_F(TerminalSessionTest, StopEndsSessionCleanly) {
  AcceptPty("pty-6");
  start();
  ASSERT_TRUE(watcher_.wait_watching());
  terminal_session_->stop();
  auto err = wait();
  ASSERT_TRUE(err.has_value());
  EXPECT_FALSE(*err);
  EXPECT_EQ(terminal_.restore_calls(), 1);
}

} // namespace qbeecli
