#include "security/denial_cache.hpp"

#include <mutex>

namespace rbagate {

DenialCache::DenialCache(const Config& config)
    : config_(config) {}

void DenialCache::record_denial(const std::string& principal) {
    record_denial(principal, Clock::now());
}

void DenialCache::record_denial(const std::string& principal, Clock::time_point at) {
    total_denials_.fetch_add(1, std::memory_order_relaxed);

    std::unique_lock lock(mutex_);
    const auto [it, inserted] = records_.try_emplace(principal, at);
    if (!inserted && it->second < at) {
        it->second = at;
    }
}

bool DenialCache::is_currently_denied(const std::string& principal) {
    return is_currently_denied(principal, Clock::now());
}

bool DenialCache::is_currently_denied(const std::string& principal, Clock::time_point now) {
    {
        std::shared_lock lock(mutex_);
        const auto it = records_.find(principal);
        if (it == records_.end()) {
            return false;
        }
        if (is_live(it->second, now)) {
            total_blocks_.fetch_add(1, std::memory_order_relaxed);
            return true;
        }
    }

    // Expired under the shared lock. Re-check under the exclusive lock: the
    // record may have been refreshed or removed since.
    std::unique_lock lock(mutex_);
    const auto it = records_.find(principal);
    if (it == records_.end()) {
        return false;
    }
    if (is_live(it->second, now)) {
        total_blocks_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    records_.erase(it);
    total_expired_.fetch_add(1, std::memory_order_relaxed);
    return false;
}

void DenialCache::clear(const std::string& principal) {
    std::unique_lock lock(mutex_);
    records_.erase(principal);
}

size_t DenialCache::purge_expired(Clock::time_point now) {
    std::unique_lock lock(mutex_);
    const size_t removed = std::erase_if(records_,
        [&](const auto& entry) { return !is_live(entry.second, now); });
    total_expired_.fetch_add(removed, std::memory_order_relaxed);
    return removed;
}

std::optional<DenialCache::Clock::time_point> DenialCache::last_denial(
    const std::string& principal) const {
    std::shared_lock lock(mutex_);
    if (const auto it = records_.find(principal); it != records_.end()) {
        return it->second;
    }
    return std::nullopt;
}

size_t DenialCache::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

} // namespace rbagate
