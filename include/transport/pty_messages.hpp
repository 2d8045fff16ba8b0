#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace qbeecli::transport {

// Control message for a remote PTY. The first one travels as the payload
// of the pty stream open (session_id empty, optional command); later ones
// are resize notices on dedicated pty_command streams.
struct PTYCommand {
  std::string type{"resize"};
  std::string session_id;
  std::uint16_t cols{0};
  std::uint16_t rows{0};
  std::string command;
  std::vector<std::string> command_args;
};

void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const PTYCommand &cmd);
PTYCommand tag_invoke(const boost::json::value_to_tag<PTYCommand> &,
                      const boost::json::value &jv);

}  // namespace qbeecli::transport
