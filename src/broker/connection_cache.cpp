#include "broker/connection_cache.hpp"

#include <vector>

namespace qbeecli::broker {
namespace net = boost::asio;

namespace {

void CancelAll(std::vector<std::function<void()>> &cancels) {
  for (auto &cancel : cancels) {
    if (cancel) {
      cancel();
    }
  }
}

}  // namespace

ConnectionCache::~ConnectionCache() { stop_gc(); }

void ConnectionCache::add(const std::string &key, TunnelHandle handle) {
  std::vector<std::function<void()>> cancels;
  handle.key = key;
  if (handle.last_used == Clock::time_point{}) {
    handle.last_used = Clock::now();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      if (it->second.id != handle.id) {
        cancels.push_back(std::move(it->second.cancel));
      }
      it->second = std::move(handle);
    } else {
      entries_.emplace(key, std::move(handle));
    }
  }
  CancelAll(cancels);
}

std::optional<TunnelHandle> ConnectionCache::get(const std::string &key,
                                                 Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  it->second.last_used = now;
  return it->second;
}

bool ConnectionCache::remove(const std::string &key) {
  std::vector<std::function<void()>> cancels;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return false;
    }
    cancels.push_back(std::move(it->second.cancel));
    entries_.erase(it);
  }
  CancelAll(cancels);
  return true;
}

bool ConnectionCache::remove_if(const std::string &key, std::uint64_t id) {
  std::vector<std::function<void()>> cancels;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.id != id) {
      return false;
    }
    cancels.push_back(std::move(it->second.cancel));
    entries_.erase(it);
  }
  CancelAll(cancels);
  return true;
}

std::size_t ConnectionCache::clean_up(Clock::time_point now) {
  std::vector<std::function<void()>> cancels;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (now - it->second.last_used > ttl_) {
        BOOST_LOG_SEV(lg, trivial::debug)
            << "evicting idle tunnel " << it->first;
        cancels.push_back(std::move(it->second.cancel));
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
  }
  CancelAll(cancels);
  return cancels.size();
}

std::size_t ConnectionCache::clear() {
  std::vector<std::function<void()>> cancels;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[key, handle] : entries_) {
      cancels.push_back(std::move(handle.cancel));
    }
    entries_.clear();
  }
  CancelAll(cancels);
  return cancels.size();
}

std::size_t ConnectionCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void ConnectionCache::start_gc(net::any_io_executor executor,
                               std::chrono::milliseconds period) {
  std::lock_guard<std::mutex> lock(gc_mutex_);
  if (gc_running_) {
    return;
  }
  gc_running_ = true;
  gc_period_ = period;
  gc_timer_ = std::make_unique<net::steady_timer>(executor);
  ScheduleGc();
}

void ConnectionCache::stop_gc() {
  std::lock_guard<std::mutex> lock(gc_mutex_);
  gc_running_ = false;
  if (gc_timer_) {
    gc_timer_->cancel();
  }
}

// gc_mutex_ held.
void ConnectionCache::ScheduleGc() {
  gc_timer_->expires_after(gc_period_);
  gc_timer_->async_wait([this](boost::system::error_code ec) {
    if (ec) {
      return;
    }
    const auto evicted = clean_up();
    if (evicted > 0) {
      BOOST_LOG_SEV(lg, trivial::info)
          << "connection cache evicted " << evicted << " idle tunnel(s)";
    }
    std::lock_guard<std::mutex> lock(gc_mutex_);
    if (gc_running_) {
      ScheduleGc();
    }
  });
}

}  // namespace qbeecli::broker
