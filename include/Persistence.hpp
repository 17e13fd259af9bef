#ifndef PERSISTENCE_HPP
#define PERSISTENCE_HPP

#include "Types.hpp"
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

// ============== Persistence Gateway Interface ==============
// Best-effort mirror of unit state and the audit trail. Callers treat any
// exception thrown from here as a logged, non-fatal failure.

class IPersistenceGateway {
public:
    virtual ~IPersistenceGateway() = default;

    virtual void upsertUnitState(const UnitSnapshot& unit) = 0;
    virtual void appendEvent(const AuditEvent& event) = 0;
};

// ============== In-Memory Gateway ==============

struct UnitRow {
    UnitSnapshot unit;
    std::chrono::system_clock::time_point lastUpdated;
};

// Keeps the newest eventCapacity events; older ones are dropped on append.
class InMemoryGateway : public IPersistenceGateway {
public:
    static constexpr std::size_t kMaxEventPage = 1000;
    static constexpr std::size_t kDefaultEventCapacity = 10 * kMaxEventPage;

private:
    std::map<int, UnitRow> units_;
    std::deque<AuditEvent> events_;
    std::size_t eventCapacity_;
    mutable std::mutex mutex_;

public:
    explicit InMemoryGateway(std::size_t eventCapacity = kDefaultEventCapacity);

    void upsertUnitState(const UnitSnapshot& unit) override;
    void appendEvent(const AuditEvent& event) override;

    // Latest mirrored rows, ordered by unit id
    std::vector<UnitRow> unitRows() const;
    std::optional<UnitRow> unitRow(int unitId) const;

    // Newest first; limit is capped at kMaxEventPage
    std::vector<AuditEvent> events(std::size_t limit = 100,
                                   std::size_t offset = 0,
                                   std::optional<EventType> type = std::nullopt) const;
    std::size_t eventCount() const;
    std::size_t eventCapacity() const { return eventCapacity_; }
};

#endif // PERSISTENCE_HPP
