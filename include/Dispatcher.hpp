#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include "Types.hpp"
#include "ElevatorUnit.hpp"
#include "IdempotencyCache.hpp"
#include "Logger.hpp"
#include "Persistence.hpp"
#include "TaskRegistry.hpp"
#include "WorkerPool.hpp"
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

using Fleet = std::vector<std::unique_ptr<ElevatorUnit>>;

// ============== Dispatcher ==============
// Two-phase protocol: select and reserve a unit under the fleet lock, then
// run the ride on the worker pool. The caller learns the outcome only by
// polling getTaskStatus.
//
// Rides stacked on one unit queue in that unit's lane. A lane occupies at
// most one pool worker at a time, and the pool has at least one worker per
// unit, so a busy car never delays rides on another car.

class Dispatcher {
private:
    Config config_;
    Fleet fleet_;
    IPersistenceGateway& gateway_;
    Logger& logger_;

    std::mutex fleetMutex_;
    IdempotencyCache idempotency_;  // Guarded by fleetMutex_
    AssignmentMetrics metrics_;     // Guarded by fleetMutex_
    bool accepting_ = true;         // Guarded by fleetMutex_

    TaskRegistry tasks_;

    struct RideLane {
        std::deque<WorkerPool::Job> rides;
        bool draining = false;  // A pool job is running this lane
    };
    std::mutex laneMutex_;
    std::map<int, RideLane> lanes_;  // Guarded by laneMutex_

    bool stopping_ = false;  // Guarded by fleetMutex_
    WorkerPool pool_;

public:
    Dispatcher(const Config& config, Fleet fleet,
               IPersistenceGateway& gateway, Logger& logger);
    ~Dispatcher();

    // Non-copyable
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    AssignmentResult assign(int fromFloor, int toFloor, const std::string& callerId,
                            const std::optional<std::string>& idempotencyKey = std::nullopt);

    StatusSnapshot getStatus();
    TaskRecord getTaskStatus(const std::string& taskId) const;

    void setMaintenance(int unitId, bool enabled);

    // Refuse new assignments and wait for every accepted ride to finish
    void shutdown();

    const Config& getConfig() const { return config_; }
    ElevatorUnit& getUnit(int unitId);

private:
    void validateFloor(const char* field, int floor) const;

    // Candidate search; nullptr when nothing qualifies
    ElevatorUnit* selectUnit(int fromFloor, Direction required) const;

    double estimateArrival(const UnitSnapshot& unit, int fromFloor) const;

    // False when the pool no longer accepts work
    bool enqueueRide(int unitId, WorkerPool::Job ride);
    void drainLane(int unitId);

    // Runs on a worker thread
    void executeCall(ElevatorUnit& unit, int fromFloor, int toFloor,
                     const std::string& taskId, const std::string& callerId);

    void recordEvent(EventType type, const std::string& detail,
                     const std::string& source, std::optional<int> unitId,
                     Severity severity = Severity::Info);
};

// ============== Route Helpers ==============

// True when floor lies on the unit's oriented route [current, destination]
bool liesOnRoute(const UnitSnapshot& unit, int floor);

// ============== Factory ==============

// Units numbered 1..numElevators, all parked at floor 1
Fleet createFleet(const Config& config, IMotionControl& motion,
                  IPersistenceGateway& gateway, Logger& logger);

#endif // DISPATCHER_HPP
