#ifndef IDEMPOTENCY_CACHE_HPP
#define IDEMPOTENCY_CACHE_HPP

#include "Types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

// ============== Idempotency Cache ==============
// Not internally synchronized: the dispatcher only touches it under the
// fleet lock, so lookup and store are atomic with the reservation.

struct RequestFingerprint {
    int fromFloor = 0;
    int toFloor = 0;

    bool operator==(const RequestFingerprint& other) const {
        return fromFloor == other.fromFloor && toFloor == other.toFloor;
    }
    bool operator!=(const RequestFingerprint& other) const {
        return !(*this == other);
    }
};

class IdempotencyCache {
public:
    using Clock = std::chrono::steady_clock;

private:
    struct Entry {
        AssignmentResult result;
        Clock::time_point createdAt;
        RequestFingerprint fingerprint;
    };

    std::unordered_map<std::string, Entry> entries_;
    std::chrono::milliseconds ttl_;

public:
    explicit IdempotencyCache(std::chrono::milliseconds ttl);

    // Drops entries older than the TTL; returns how many were removed
    std::size_t sweep(Clock::time_point now = Clock::now());

    // Stored result for key, or nullopt if absent.
    // Throws IdempotencyConflictError when the fingerprint differs.
    std::optional<AssignmentResult> lookup(const std::string& key,
                                           const RequestFingerprint& fingerprint) const;

    void store(const std::string& key, const RequestFingerprint& fingerprint,
               const AssignmentResult& result, Clock::time_point now = Clock::now());

    std::size_t size() const { return entries_.size(); }
    std::chrono::milliseconds ttl() const { return ttl_; }
};

#endif // IDEMPOTENCY_CACHE_HPP
