#include "Persistence.hpp"
#include <algorithm>

InMemoryGateway::InMemoryGateway(std::size_t eventCapacity)
    : eventCapacity_(std::max<std::size_t>(1, eventCapacity)) {}

void InMemoryGateway::upsertUnitState(const UnitSnapshot& unit) {
    std::lock_guard<std::mutex> lock(mutex_);
    units_[unit.id] = UnitRow{unit, std::chrono::system_clock::now()};
}

void InMemoryGateway::appendEvent(const AuditEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    while (events_.size() > eventCapacity_) {
        events_.pop_front();
    }
}

std::vector<UnitRow> InMemoryGateway::unitRows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UnitRow> rows;
    rows.reserve(units_.size());
    for (const auto& [id, row] : units_) {
        rows.push_back(row);
    }
    return rows;
}

std::optional<UnitRow> InMemoryGateway::unitRow(int unitId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(unitId);
    if (it == units_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AuditEvent> InMemoryGateway::events(std::size_t limit,
                                                std::size_t offset,
                                                std::optional<EventType> type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    limit = std::min(limit, kMaxEventPage);

    std::vector<AuditEvent> page;
    std::size_t skipped = 0;
    for (auto it = events_.rbegin(); it != events_.rend() && page.size() < limit; ++it) {
        if (type && it->type != *type) continue;
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        page.push_back(*it);
    }
    return page;
}

std::size_t InMemoryGateway::eventCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}
