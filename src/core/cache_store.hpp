#ifndef CACHE_STORE_HPP
#define CACHE_STORE_HPP

#include "core/logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * Key/value store with per-entry TTL and single-flight computation.
 *
 * Expiry is lazy: an expired entry reads as absent through get() and
 * get_or_compute(), but stays in the map until it is overwritten or evicted so
 * that get_stale() can still hand it out for degraded-mode fallback.
 *
 * get_or_compute() runs the compute function at most once per key at a time.
 * Callers that arrive while a computation is in flight wait on the same
 * shared future and receive the same value, or the same exception. No lock is
 * held while the compute function runs.
 */
template <typename V> class CacheStore {
public:
  using Clock = std::chrono::steady_clock;
  using TimeSource = std::function<Clock::time_point()>;

  struct CacheEntry {
    V value;
    Clock::time_point inserted_at;
    std::chrono::seconds ttl;
  };

  struct Config {
    size_t max_entries{256};
  };

  // How get_or_compute() obtained its value
  enum class Lookup { HIT, COMPUTED, COALESCED };

  struct Statistics {
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> expired_reads{0};
    std::atomic<uint64_t> stale_reads{0};
    std::atomic<uint64_t> computations{0};
    std::atomic<uint64_t> coalesced_waits{0};
    std::atomic<uint64_t> evicted_entries{0};

    // Copy constructor for atomic types
    Statistics() = default;
    Statistics(const Statistics &other)
        : hits(other.hits.load()), misses(other.misses.load()),
          expired_reads(other.expired_reads.load()),
          stale_reads(other.stale_reads.load()),
          computations(other.computations.load()),
          coalesced_waits(other.coalesced_waits.load()),
          evicted_entries(other.evicted_entries.load()) {}

    double hit_rate() const {
      uint64_t total = hits.load() + misses.load();
      return total == 0 ? 0.0
                        : static_cast<double>(hits.load()) * 100.0 /
                              static_cast<double>(total);
    }
  };

  explicit CacheStore(const Config &config, TimeSource now = Clock::now)
      : config_(config), now_(std::move(now)) {
    if (config_.max_entries == 0)
      config_.max_entries = 1;
  }
  CacheStore() : CacheStore(Config{}) {}

  CacheStore(const CacheStore &) = delete;
  CacheStore &operator=(const CacheStore &) = delete;

  std::optional<V> get(const std::string &key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
      if (!is_expired(it->second, now_())) {
        stats_.hits.fetch_add(1, std::memory_order_relaxed);
        return it->second.value;
      }
      stats_.expired_reads.fetch_add(1, std::memory_order_relaxed);
    }

    stats_.misses.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }

  // Returns the last stored value for the key, fresh or expired
  std::optional<V> get_stale(const std::string &key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end())
      return std::nullopt;

    stats_.stale_reads.fetch_add(1, std::memory_order_relaxed);
    return it->second.value;
  }

  void set(const std::string &key, V value, std::chrono::seconds ttl) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    store_locked(key, std::move(value), ttl);
  }

  template <typename ComputeFn>
  V get_or_compute(const std::string &key, std::chrono::seconds ttl,
                   ComputeFn &&compute, Lookup *lookup = nullptr) {
    std::shared_future<V> pending;
    std::promise<V> promise;
    bool owner = false;

    {
      std::unique_lock<std::shared_mutex> lock(mutex_);

      auto it = entries_.find(key);
      if (it != entries_.end()) {
        if (!is_expired(it->second, now_())) {
          stats_.hits.fetch_add(1, std::memory_order_relaxed);
          if (lookup)
            *lookup = Lookup::HIT;
          return it->second.value;
        }
        stats_.expired_reads.fetch_add(1, std::memory_order_relaxed);
      }
      stats_.misses.fetch_add(1, std::memory_order_relaxed);

      auto flight = in_flight_.find(key);
      if (flight != in_flight_.end()) {
        pending = flight->second;
        stats_.coalesced_waits.fetch_add(1, std::memory_order_relaxed);
      } else {
        pending = promise.get_future().share();
        in_flight_.emplace(key, pending);
        owner = true;
      }
    }

    if (lookup)
      *lookup = owner ? Lookup::COMPUTED : Lookup::COALESCED;

    if (!owner) {
      LOG(LogLevel::TRACE, LogComponent::CACHE,
          "Waiting on in-flight computation for key " << key);
      return pending.get();
    }

    stats_.computations.fetch_add(1, std::memory_order_relaxed);
    try {
      V value = compute();
      {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        store_locked(key, value, ttl);
        in_flight_.erase(key);
      }
      promise.set_value(value);
      return value;
    } catch (...) {
      {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        in_flight_.erase(key);
      }
      // Waiters observe the same failure; nothing is cached
      promise.set_exception(std::current_exception());
      throw;
    }
  }

  bool erase(const std::string &key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return entries_.erase(key) > 0;
  }

  void clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
    LOG(LogLevel::DEBUG, LogComponent::CACHE, "CacheStore cleared");
  }

  size_t size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
  }

  bool is_in_flight(const std::string &key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return in_flight_.count(key) > 0;
  }

  Statistics get_statistics() const { return stats_; }

private:
  static bool is_expired(const CacheEntry &entry, Clock::time_point now) {
    return now >= entry.inserted_at + entry.ttl;
  }

  void store_locked(const std::string &key, V value,
                    std::chrono::seconds ttl) {
    auto it = entries_.find(key);
    if (it == entries_.end() && entries_.size() >= config_.max_entries)
      evict_oldest_locked(entries_.size() - config_.max_entries + 1);

    entries_[key] = CacheEntry{std::move(value), now_(), ttl};
  }

  void evict_oldest_locked(size_t count) {
    std::vector<std::pair<Clock::time_point, std::string>> by_age;
    by_age.reserve(entries_.size());
    for (const auto &[key, entry] : entries_)
      by_age.emplace_back(entry.inserted_at, key);

    count = std::min(count, by_age.size());
    std::partial_sort(by_age.begin(), by_age.begin() + count, by_age.end());
    for (size_t i = 0; i < count; ++i)
      entries_.erase(by_age[i].second);

    stats_.evicted_entries.fetch_add(count, std::memory_order_relaxed);
    LOG(LogLevel::DEBUG, LogComponent::CACHE,
        "Evicted " << count << " oldest cache entries");
  }

  Config config_;
  TimeSource now_;
  mutable Statistics stats_;

  std::unordered_map<std::string, CacheEntry> entries_;
  std::unordered_map<std::string, std::shared_future<V>> in_flight_;
  mutable std::shared_mutex mutex_;
};

#endif // CACHE_STORE_HPP
