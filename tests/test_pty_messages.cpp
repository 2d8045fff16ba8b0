#include <gtest/gtest.h>

#include <boost/json.hpp>

#include "transport/pty_messages.hpp"

namespace qbeecli::transport {
namespace json = boost::json;

TEST(PtyMessagesTest, ResizeSerializesWithoutCommand) {
  PTYCommand cmd;
  cmd.session_id = "abc";
  cmd.cols = 120;
  cmd.rows = 40;

  auto jv = json::value_from(cmd);
  const auto &obj = jv.as_object();
  EXPECT_EQ(obj.at("type"), "resize");
  EXPECT_EQ(obj.at("session_id"), "abc");
  EXPECT_EQ(obj.at("cols").to_number<int>(), 120);
  EXPECT_EQ(obj.at("rows").to_number<int>(), 40);
  EXPECT_EQ(obj.if_contains("command"), nullptr);
}

TEST(PtyMessagesTest, OpenCarriesCommandAndArguments) {
  PTYCommand cmd;
  cmd.cols = 80;
  cmd.rows = 24;
  cmd.command = "top";
  cmd.command_args = {"-b", "-n", "1"};

  auto parsed = json::value_to<PTYCommand>(json::value_from(cmd));
  EXPECT_EQ(parsed.type, "resize");
  EXPECT_TRUE(parsed.session_id.empty());
  EXPECT_EQ(parsed.cols, 80);
  EXPECT_EQ(parsed.rows, 24);
  EXPECT_EQ(parsed.command, "top");
  EXPECT_EQ(parsed.command_args, (std::vector<std::string>{"-b", "-n", "1"}));
}

TEST(PtyMessagesTest, RejectsMissingOrOversizedDimensions) {
  EXPECT_THROW(json::value_to<PTYCommand>(
                   json::parse(R"({"type":"resize","rows":24})")),
               std::runtime_error);
  EXPECT_THROW(json::value_to<PTYCommand>(
                   json::parse(R"({"type":"resize","cols":70000,"rows":24})")),
               std::runtime_error);
  EXPECT_THROW(json::value_to<PTYCommand>(
                   json::parse(R"({"type":"resize","cols":-1,"rows":24})")),
               std::runtime_error);
  EXPECT_THROW(json::value_to<PTYCommand>(json::parse("[]")),
               std::runtime_error);
}

} // namespace qbeecli::transport
