#pragma once

#include <boost/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace qbeecli {
namespace fs = std::filesystem;

// Ordered config directories. For every name, <dir>/<name>.json and then
// <dir>/<name>.override.json are merged key by key, later files winning.
class ConfigSources {
 public:
  explicit ConfigSources(std::vector<fs::path> paths)
      : paths_(std::move(paths)) {}

  // Empty optional when no directory has the file. Throws
  // std::runtime_error on unreadable files or JSON that is not an object.
  std::optional<boost::json::value> json_content(const std::string &name) const;

  const std::vector<fs::path> &paths() const { return paths_; }

  static std::vector<fs::path> default_paths();

 private:
  std::vector<fs::path> paths_;
};

// Returns the environment value, or an empty optional when unset or empty.
inline std::optional<std::string> env_value(const char *name) {
  if (const char *v = std::getenv(name); v && *v) {
    return std::string(v);
  }
  return std::nullopt;
}

}  // namespace qbeecli
