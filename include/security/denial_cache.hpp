#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace rbagate {

/**
 * @brief Short-lived negative cache of principals whose last full check was denied.
 *
 * Holds principal -> timestamp of last denial, nothing else. Expiry is lazy:
 * a lookup that finds an expired record evicts it. There is no background
 * sweeper; purge_expired() exists for hosts that want to bound memory
 * explicitly.
 *
 * Thread-safe. Lookups take the shared lock and upgrade to the exclusive lock
 * only to evict, re-checking the record after the upgrade so a denial
 * refreshed in between is never dropped. Concurrent record_denial() calls for
 * the same principal keep the latest timestamp.
 */
class DenialCache {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        std::chrono::seconds ttl{3600};
    };

    DenialCache() : DenialCache(Config{}) {}
    explicit DenialCache(const Config& config);

    void record_denial(const std::string& principal);
    void record_denial(const std::string& principal, Clock::time_point at);

    [[nodiscard]] bool is_currently_denied(const std::string& principal);
    [[nodiscard]] bool is_currently_denied(const std::string& principal, Clock::time_point now);

    void clear(const std::string& principal);

    /// Evict every record expired at `now`. Returns the number removed.
    size_t purge_expired(Clock::time_point now);

    /// Timestamp of the last recorded denial, expired or not (no eviction)
    [[nodiscard]] std::optional<Clock::time_point> last_denial(const std::string& principal) const;

    [[nodiscard]] size_t size() const;

    [[nodiscard]] std::chrono::seconds ttl() const { return config_.ttl; }

    [[nodiscard]] uint64_t total_denials() const {
        return total_denials_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t total_blocks() const {
        return total_blocks_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t total_expired() const {
        return total_expired_.load(std::memory_order_relaxed);
    }

private:
    [[nodiscard]] bool is_live(Clock::time_point denied_at, Clock::time_point now) const {
        return now - denied_at < config_.ttl;
    }

    Config config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Clock::time_point> records_;

    std::atomic<uint64_t> total_denials_{0};
    std::atomic<uint64_t> total_blocks_{0};
    std::atomic<uint64_t> total_expired_{0};
};

} // namespace rbagate
