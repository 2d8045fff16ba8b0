#include "conf/config_sources.hpp"

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace qbeecli {
namespace json = boost::json;

namespace {

std::optional<json::object> read_object(const fs::path &file) {
  std::error_code ec;
  if (!fs::exists(file, ec)) {
    return std::nullopt;
  }
  std::ifstream ifs(file);
  if (!ifs) {
    throw std::runtime_error(
        fmt::format("Unable to open config file: {}", file.string()));
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  boost::system::error_code jec;
  auto value = json::parse(content, jec);
  if (jec) {
    throw std::runtime_error(fmt::format("Invalid JSON in {}: {}",
                                         file.string(), jec.message()));
  }
  if (!value.is_object()) {
    throw std::runtime_error(
        fmt::format("Config file {} is not a JSON object", file.string()));
  }
  return std::move(value.as_object());
}

} // namespace

std::optional<json::value>
ConfigSources::json_content(const std::string &name) const {
  std::optional<json::object> merged;
  for (const auto &dir : paths_) {
    for (const auto &file :
         {dir / (name + ".json"), dir / (name + ".override.json")}) {
      auto obj = read_object(file);
      if (!obj) {
        continue;
      }
      if (!merged) {
        merged = std::move(*obj);
        continue;
      }
      for (const auto &kv : *obj) {
        (*merged)[kv.key()] = kv.value();
      }
    }
  }
  if (!merged) {
    return std::nullopt;
  }
  return json::value(std::move(*merged));
}

std::vector<fs::path> ConfigSources::default_paths() {
  if (auto dir = env_value("QBEE_CONFIG_DIR")) {
    return {fs::path(*dir)};
  }
  if (auto xdg = env_value("XDG_CONFIG_HOME")) {
    return {fs::path(*xdg) / "qbee"};
  }
  if (auto home = env_value("HOME")) {
    return {fs::path(*home) / ".config" / "qbee"};
  }
  return {};
}

} // namespace qbeecli
