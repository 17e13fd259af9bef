#ifndef TEST_DOUBLES_HPP
#define TEST_DOUBLES_HPP

#include "Dispatcher.hpp"
#include "ElevatorUnit.hpp"
#include "Persistence.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

// ============== Motion Doubles ==============

// No waiting (or a fixed short wait); records every phase it was asked for
class InstantMotion : public IMotionControl {
private:
    int stepMs_;
    mutable std::mutex mutex_;
    std::vector<std::pair<int, int>> travels_;
    std::vector<ElevatorState> doorPhases_;

public:
    explicit InstantMotion(int stepMs = 0) : stepMs_(stepMs) {}

    void travelOneFloor(int unitId, int fromFloor, int toFloor) override {
        (void)unitId;
        pause();
        std::lock_guard<std::mutex> lock(mutex_);
        travels_.emplace_back(fromFloor, toFloor);
    }

    void cycleDoor(int unitId, int floor, ElevatorState phase) override {
        (void)unitId;
        (void)floor;
        pause();
        std::lock_guard<std::mutex> lock(mutex_);
        doorPhases_.push_back(phase);
    }

    std::vector<std::pair<int, int>> travels() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return travels_;
    }

    std::vector<ElevatorState> doorPhases() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return doorPhases_;
    }

private:
    void pause() const {
        if (stepMs_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(stepMs_));
        }
    }
};

// Every phase of the gated unit (0 = all units) blocks until open() is called
class GatedMotion : public IMotionControl {
private:
    int gatedUnit_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;

public:
    explicit GatedMotion(int gatedUnit = 0) : gatedUnit_(gatedUnit) {}

    void travelOneFloor(int unitId, int, int) override { waitForGate(unitId); }
    void cycleDoor(int unitId, int, ElevatorState) override { waitForGate(unitId); }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    void waitForGate(int unitId) {
        if (gatedUnit_ != 0 && unitId != gatedUnit_) {
            return;
        }
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }
};

// Motor failure on one unit, instant for the rest
class FaultyMotion : public IMotionControl {
private:
    int faultyUnit_;

public:
    explicit FaultyMotion(int faultyUnit) : faultyUnit_(faultyUnit) {}

    void travelOneFloor(int unitId, int, int) override {
        if (unitId == faultyUnit_) {
            throw std::runtime_error("motor overheated");
        }
    }
    void cycleDoor(int, int, ElevatorState) override {}
};

// ============== Gateway Doubles ==============

class RecordingGateway : public InMemoryGateway {
private:
    mutable std::mutex historyMutex_;
    std::map<int, std::vector<UnitSnapshot>> history_;

public:
    void upsertUnitState(const UnitSnapshot& unit) override {
        {
            std::lock_guard<std::mutex> lock(historyMutex_);
            history_[unit.id].push_back(unit);
        }
        InMemoryGateway::upsertUnitState(unit);
    }

    std::vector<UnitSnapshot> history(int unitId) const {
        std::lock_guard<std::mutex> lock(historyMutex_);
        auto it = history_.find(unitId);
        return it == history_.end() ? std::vector<UnitSnapshot>{} : it->second;
    }
};

// Stalls the first publish of a unit at a floor once its doors have closed
// there, i.e. the hand-off between one leg and the next
class HoldingGateway : public InMemoryGateway {
private:
    int unitId_;
    int floor_;
    std::mutex holdMutex_;
    std::condition_variable cv_;
    bool doorsClosed_ = false;
    bool held_ = false;
    bool released_ = false;

public:
    HoldingGateway(int unitId, int floor) : unitId_(unitId), floor_(floor) {}

    void upsertUnitState(const UnitSnapshot& unit) override {
        InMemoryGateway::upsertUnitState(unit);
        if (unit.id != unitId_ || unit.currentFloor != floor_) {
            return;
        }
        std::unique_lock<std::mutex> lock(holdMutex_);
        if (unit.state == ElevatorState::DoorClosing) {
            doorsClosed_ = true;
            return;
        }
        if (!doorsClosed_ || held_) {
            return;
        }
        held_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });
    }

    bool waitUntilHeld(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(holdMutex_);
        return cv_.wait_for(lock, timeout, [this] { return held_; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(holdMutex_);
            released_ = true;
        }
        cv_.notify_all();
    }
};

class ThrowingGateway : public IPersistenceGateway {
public:
    void upsertUnitState(const UnitSnapshot&) override {
        throw std::runtime_error("database unavailable");
    }
    void appendEvent(const AuditEvent&) override {
        throw std::runtime_error("database unavailable");
    }
};

// ============== Helpers ==============

inline Fleet makeFleet(const std::vector<int>& startFloors, int numFloors,
                       IMotionControl& motion, IPersistenceGateway& gateway,
                       Logger& logger) {
    Fleet fleet;
    int id = 1;
    for (int floor : startFloors) {
        fleet.push_back(std::make_unique<ElevatorUnit>(
            id++, numFloors, motion, gateway, logger, floor));
    }
    return fleet;
}

inline TaskRecord waitForTask(const Dispatcher& dispatcher, const std::string& taskId,
                              std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    TaskRecord record = dispatcher.getTaskStatus(taskId);
    while (record.status == TaskStatus::Running &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        record = dispatcher.getTaskStatus(taskId);
    }
    return record;
}

#endif // TEST_DOUBLES_HPP
