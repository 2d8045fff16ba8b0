#include "transport/pty_messages.hpp"

#include <fmt/format.h>

#include <limits>
#include <stdexcept>

namespace qbeecli::transport {
namespace json = boost::json;

namespace {

const json::object &RequireObject(const json::value &jv, const char *ctx) {
  if (!jv.is_object()) {
    throw std::runtime_error(fmt::format("{} must be an object", ctx));
  }
  return jv.as_object();
}

std::string RequireString(const json::object &obj, const char *key,
                          const char *ctx) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_string()) {
      return std::string(p->as_string().c_str());
    }
  }
  throw std::runtime_error(fmt::format("{} missing string field '{}'", ctx, key));
}

std::uint16_t RequireDimension(const json::object &obj, const char *key,
                               const char *ctx) {
  if (auto *p = obj.if_contains(key)) {
    std::int64_t v = -1;
    if (p->is_int64()) {
      v = p->as_int64();
    } else if (p->is_uint64() &&
               p->as_uint64() <= std::numeric_limits<std::uint16_t>::max()) {
      v = static_cast<std::int64_t>(p->as_uint64());
    }
    if (v >= 0 && v <= std::numeric_limits<std::uint16_t>::max()) {
      return static_cast<std::uint16_t>(v);
    }
  }
  throw std::runtime_error(
      fmt::format("{} missing 16-bit field '{}'", ctx, key));
}

} // namespace

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const PTYCommand &cmd) {
  json::object obj{{"type", cmd.type},
                   {"session_id", cmd.session_id},
                   {"cols", cmd.cols},
                   {"rows", cmd.rows}};
  if (!cmd.command.empty()) {
    obj["command"] = cmd.command;
    json::array args;
    for (const auto &a : cmd.command_args) {
      args.emplace_back(a);
    }
    obj["command_args"] = std::move(args);
  }
  jv = std::move(obj);
}

PTYCommand tag_invoke(const json::value_to_tag<PTYCommand> &,
                      const json::value &jv) {
  const auto &obj = RequireObject(jv, "PTYCommand");
  PTYCommand cmd;
  cmd.type = RequireString(obj, "type", "PTYCommand");
  if (auto *p = obj.if_contains("session_id"); p && p->is_string()) {
    cmd.session_id = std::string(p->as_string().c_str());
  }
  cmd.cols = RequireDimension(obj, "cols", "PTYCommand");
  cmd.rows = RequireDimension(obj, "rows", "PTYCommand");
  if (auto *p = obj.if_contains("command"); p && p->is_string()) {
    cmd.command = std::string(p->as_string().c_str());
  }
  if (auto *p = obj.if_contains("command_args"); p && p->is_array()) {
    for (const auto &a : p->as_array()) {
      if (!a.is_string()) {
        throw std::runtime_error("PTYCommand command_args must be strings");
      }
      cmd.command_args.emplace_back(a.as_string().c_str());
    }
  }
  return cmd;
}

} // namespace qbeecli::transport
