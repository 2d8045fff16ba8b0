#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "util/my_logging.hpp"

namespace qbeecli::broker {

using Clock = std::chrono::steady_clock;

// A live tunnel the broker can reuse. The cache owns `cancel` and is the
// only place that calls it.
struct TunnelHandle {
  std::string key;  // <device>:<port>
  std::uint16_t local_port{0};
  std::function<void()> cancel;
  Clock::time_point last_used{};
  // Tells two tunnels for the same key apart.
  std::uint64_t id{0};
};

inline std::string CacheKey(const std::string &device_id,
                            const std::string &device_port) {
  return device_id + ":" + device_port;
}

// Mutex-guarded map of live tunnels with idle eviction. Cancel functions are
// called after the lock is released.
class ConnectionCache {
 public:
  explicit ConnectionCache(std::chrono::seconds ttl = std::chrono::minutes(5))
      : ttl_(ttl) {}
  ~ConnectionCache();

  ConnectionCache(const ConnectionCache &) = delete;
  ConnectionCache &operator=(const ConnectionCache &) = delete;

  // Replaces (and cancels) a different tunnel already stored under the key.
  // An unset last_used becomes now.
  void add(const std::string &key, TunnelHandle handle);
  // Refreshes last_used on a hit.
  std::optional<TunnelHandle> get(const std::string &key,
                                  Clock::time_point now = Clock::now());
  // Removes and cancels the entry.
  bool remove(const std::string &key);
  // Like remove(), but only while the entry is still the tunnel `id`.
  bool remove_if(const std::string &key, std::uint64_t id);
  // Evicts and cancels entries idle longer than the TTL. Returns the number
  // evicted.
  std::size_t clean_up(Clock::time_point now = Clock::now());
  // Removes and cancels every entry.
  std::size_t clear();
  std::size_t size() const;
  std::chrono::seconds ttl() const { return ttl_; }

  void start_gc(boost::asio::any_io_executor executor,
                std::chrono::milliseconds period);
  void stop_gc();

 private:
  void ScheduleGc();

  std::chrono::seconds ttl_;
  mutable std::mutex mutex_;
  std::map<std::string, TunnelHandle> entries_;

  std::mutex gc_mutex_;
  std::unique_ptr<boost::asio::steady_timer> gc_timer_;
  std::chrono::milliseconds gc_period_{60000};
  bool gc_running_{false};
  src::severity_logger_mt<trivial::severity_level> lg;
};

}  // namespace qbeecli::broker
