#include "IdempotencyCache.hpp"
#include "Errors.hpp"

IdempotencyCache::IdempotencyCache(std::chrono::milliseconds ttl)
    : ttl_(ttl) {}

std::size_t IdempotencyCache::sweep(Clock::time_point now) {
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.createdAt >= ttl_) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::optional<AssignmentResult> IdempotencyCache::lookup(
    const std::string& key, const RequestFingerprint& fingerprint) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.fingerprint != fingerprint) {
        throw IdempotencyConflictError(key);
    }
    return it->second.result;
}

void IdempotencyCache::store(const std::string& key,
                             const RequestFingerprint& fingerprint,
                             const AssignmentResult& result,
                             Clock::time_point now) {
    entries_[key] = Entry{result, now, fingerprint};
}
