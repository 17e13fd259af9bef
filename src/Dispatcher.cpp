#include "Dispatcher.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <utility>

// ============== Route Helpers ==============

bool liesOnRoute(const UnitSnapshot& unit, int floor) {
    if (!unit.destinationFloor) {
        return false;
    }
    int dest = *unit.destinationFloor;

    if (unit.direction == Direction::Up) {
        return unit.currentFloor <= floor && floor <= dest;
    }
    if (unit.direction == Direction::Down) {
        return dest <= floor && floor <= unit.currentFloor;
    }
    return false;
}

// ============== Dispatcher Implementation ==============

Dispatcher::Dispatcher(const Config& config, Fleet fleet,
                       IPersistenceGateway& gateway, Logger& logger)
    : config_(config),
      fleet_(std::move(fleet)),
      gateway_(gateway),
      logger_(logger),
      idempotency_(std::chrono::milliseconds(config.idempotencyTtlMs)),
      tasks_(config.taskHistoryLimit),
      pool_(std::max(1, std::max(1, config.workersPerUnit) * static_cast<int>(fleet_.size())),
            [this](const std::string& message) { logger_.log("[ERROR] " + message); }) {
    if (fleet_.empty()) {
        throw std::invalid_argument("Dispatcher needs at least one elevator");
    }
    for (const auto& unit : fleet_) {
        lanes_[unit->getId()];
    }

    logger_.log("Dispatcher initialized with " + std::to_string(fleet_.size()) +
                " elevators, " + std::to_string(config_.numFloors) + " floors, " +
                std::to_string(pool_.workerCount()) + " workers");
}

Dispatcher::~Dispatcher() {
    shutdown();
}

AssignmentResult Dispatcher::assign(int fromFloor, int toFloor,
                                    const std::string& callerId,
                                    const std::optional<std::string>& idempotencyKey) {
    validateFloor("from_floor", fromFloor);
    validateFloor("to_floor", toFloor);

    RequestFingerprint fingerprint{fromFloor, toFloor};
    Direction required = (toFloor > fromFloor) ? Direction::Up : Direction::Down;

    AssignmentResult result;
    UnitSnapshot before;
    ElevatorUnit* unit = nullptr;
    {
        std::lock_guard<std::mutex> lock(fleetMutex_);
        if (!accepting_) {
            throw DispatchError("Dispatcher is shutting down");
        }
        ++metrics_.totalCalls;

        idempotency_.sweep();
        if (idempotencyKey) {
            std::optional<AssignmentResult> cached;
            try {
                cached = idempotency_.lookup(*idempotencyKey, fingerprint);
            } catch (const IdempotencyConflictError& e) {
                ++metrics_.failedAssignments;
                logger_.log(std::string("[WARN] ") + e.what());
                throw;
            }
            if (cached) {
                ++metrics_.idempotentReplays;
                logger_.logReplay(*idempotencyKey, *cached);
                return *cached;
            }
        }

        unit = selectUnit(fromFloor, required);
        if (unit == nullptr) {
            ++metrics_.failedAssignments;
            logger_.log("[WARN] No elevator available for " + std::to_string(fromFloor) +
                        "->" + std::to_string(toFloor));
            throw NoAvailableUnitError();
        }

        before = unit->snapshot();
        result.elevatorId = before.id;
        result.estimatedArrivalTime = estimateArrival(before, fromFloor);

        unit->reserve(required, toFloor);
        try {
            result.taskId = tasks_.registerTask(before.id);
            if (idempotencyKey) {
                idempotency_.store(*idempotencyKey, fingerprint, result);
            }
        } catch (const std::exception& e) {
            unit->cancelReservation(before);
            if (!result.taskId.empty()) {
                tasks_.discard(result.taskId);
            }
            ++metrics_.failedAssignments;
            logger_.log(std::string("[ERROR] Assignment rolled back: ") + e.what());
            throw;
        }
        ++metrics_.successfulAssignments;
    }

    logger_.logAssignment(result, fromFloor, toFloor);
    recordEvent(EventType::ElevatorAssigned,
                "Assigned elevator " + std::to_string(result.elevatorId) + " for " +
                    std::to_string(fromFloor) + "->" + std::to_string(toFloor),
                callerId, result.elevatorId);

    std::string taskId = result.taskId;
    bool submitted = enqueueRide(result.elevatorId,
        [this, unit, fromFloor, toFloor, taskId, callerId] {
            executeCall(*unit, fromFloor, toFloor, taskId, callerId);
        });
    if (!submitted) {
        // Shutdown won the race after the reservation was made
        unit->releaseReservation(false);
        logger_.logTaskOutcome(tasks_.fail(taskId, "dispatcher stopped before the ride started"));
    }

    return result;
}

StatusSnapshot Dispatcher::getStatus() {
    StatusSnapshot status;
    status.units.reserve(fleet_.size());
    for (const auto& unit : fleet_) {
        status.units.push_back(unit->snapshot());
    }

    status.activeTasks = tasks_.activeCount();

    bool allBusy = std::all_of(status.units.begin(), status.units.end(),
        [](const UnitSnapshot& u) { return u.state != ElevatorState::Idle; });
    status.health = allBusy ? SystemHealth::Busy : SystemHealth::Healthy;

    {
        std::lock_guard<std::mutex> lock(fleetMutex_);
        status.metrics = metrics_;
    }
    status.timestamp = std::chrono::system_clock::now();
    return status;
}

TaskRecord Dispatcher::getTaskStatus(const std::string& taskId) const {
    return tasks_.lookup(taskId);
}

void Dispatcher::setMaintenance(int unitId, bool enabled) {
    {
        std::lock_guard<std::mutex> lock(fleetMutex_);
        getUnit(unitId).setMaintenance(enabled);
    }

    logger_.log("Elevator " + std::to_string(unitId) + " maintenance " +
                (enabled ? "enabled" : "disabled"));
    recordEvent(EventType::MaintenanceChanged,
                std::string("Maintenance ") + (enabled ? "enabled" : "disabled"),
                "dispatcher", unitId, Severity::Warning);
}

void Dispatcher::shutdown() {
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(fleetMutex_);
        accepting_ = false;
        if (!stopping_) {
            stopping_ = true;
            first = true;
        }
    }

    if (first) {
        logger_.log("Dispatcher stopping, waiting for " +
                    std::to_string(tasks_.activeCount()) + " active tasks...");
    }
    // Concurrent callers all block here until the workers are joined
    pool_.shutdown();
    if (first) {
        logger_.log("Dispatcher stopped.");
    }
}

ElevatorUnit& Dispatcher::getUnit(int unitId) {
    auto it = std::find_if(fleet_.begin(), fleet_.end(),
        [unitId](const std::unique_ptr<ElevatorUnit>& u) { return u->getId() == unitId; });
    if (it == fleet_.end()) {
        throw UnknownUnitError(unitId);
    }
    return **it;
}

void Dispatcher::validateFloor(const char* field, int floor) const {
    if (floor < 1 || floor > config_.numFloors) {
        throw InvalidFloorError(field, floor, config_.numFloors);
    }
}

ElevatorUnit* Dispatcher::selectUnit(int fromFloor, Direction required) const {
    ElevatorUnit* bestIdle = nullptr;
    ElevatorUnit* bestEnRoute = nullptr;
    int bestIdleDistance = 0;
    int bestEnRouteDistance = 0;

    // Closer wins; equal distance goes to the lower id
    auto better = [](int distance, int id, ElevatorUnit* best, int bestDistance) {
        return best == nullptr || distance < bestDistance ||
               (distance == bestDistance && id < best->getId());
    };

    for (const auto& unit : fleet_) {
        UnitSnapshot s = unit->snapshot();
        int distance = std::abs(s.currentFloor - fromFloor);

        if (s.state == ElevatorState::Idle && !s.maintenance) {
            if (better(distance, s.id, bestIdle, bestIdleDistance)) {
                bestIdle = unit.get();
                bestIdleDistance = distance;
            }
        } else if (s.state == ElevatorState::Moving &&
                   s.direction == required &&
                   liesOnRoute(s, fromFloor)) {
            if (better(distance, s.id, bestEnRoute, bestEnRouteDistance)) {
                bestEnRoute = unit.get();
                bestEnRouteDistance = distance;
            }
        }
    }

    return bestIdle != nullptr ? bestIdle : bestEnRoute;
}

double Dispatcher::estimateArrival(const UnitSnapshot& unit, int fromFloor) const {
    double transitSeconds = config_.floorTransitMs / 1000.0;
    double doorSeconds = config_.doorMs / 1000.0;

    int floors;
    if (unit.state != ElevatorState::Idle && unit.destinationFloor) {
        int dest = *unit.destinationFloor;
        floors = std::abs(unit.currentFloor - dest) + std::abs(dest - fromFloor);
    } else {
        floors = std::abs(unit.currentFloor - fromFloor);
    }

    double moveTime = floors * transitSeconds;
    double doorTime = 2 * doorSeconds;  // Destination door cycle
    if (unit.currentFloor != fromFloor) {
        doorTime += 2 * doorSeconds;     // Pickup door cycle
    }
    return moveTime + doorTime;
}

bool Dispatcher::enqueueRide(int unitId, WorkerPool::Job ride) {
    std::lock_guard<std::mutex> lock(laneMutex_);
    RideLane& lane = lanes_[unitId];
    lane.rides.push_back(std::move(ride));
    if (lane.draining) {
        return true;
    }

    if (!pool_.submit([this, unitId] { drainLane(unitId); })) {
        lane.rides.pop_back();
        return false;
    }
    lane.draining = true;
    return true;
}

void Dispatcher::drainLane(int unitId) {
    while (true) {
        WorkerPool::Job ride;
        {
            std::lock_guard<std::mutex> lock(laneMutex_);
            RideLane& lane = lanes_[unitId];
            if (lane.rides.empty()) {
                lane.draining = false;
                return;
            }
            ride = std::move(lane.rides.front());
            lane.rides.pop_front();
        }
        ride();
    }
}

void Dispatcher::executeCall(ElevatorUnit& unit, int fromFloor, int toFloor,
                             const std::string& taskId, const std::string& callerId) {
    std::string route = std::to_string(fromFloor) + "->" + std::to_string(toFloor);
    try {
        if (unit.getCurrentFloor() != fromFloor) {
            unit.moveTo(fromFloor);
        }
        unit.moveTo(toFloor);

        unit.releaseReservation();
        logger_.logTaskOutcome(tasks_.complete(taskId));
        recordEvent(EventType::CallCompleted, "Completed call " + route,
                    callerId, unit.getId());
    } catch (const std::exception& e) {
        unit.markFault(e.what());
        logger_.logTaskOutcome(tasks_.fail(taskId, e.what()));
        recordEvent(EventType::CallFailed,
                    "Failed call " + route + ": " + e.what(),
                    callerId, unit.getId(), Severity::Error);
    }
}

void Dispatcher::recordEvent(EventType type, const std::string& detail,
                             const std::string& source, std::optional<int> unitId,
                             Severity severity) {
    AuditEvent event;
    event.type = type;
    event.detail = detail;
    event.source = source;
    event.unitId = unitId;
    event.severity = severity;

    try {
        gateway_.appendEvent(event);
    } catch (const std::exception& e) {
        logger_.log("[WARN] Event " + eventTypeToString(type) +
                    " not persisted: " + e.what());
    }
}

// ============== Factory ==============

Fleet createFleet(const Config& config, IMotionControl& motion,
                  IPersistenceGateway& gateway, Logger& logger) {
    Fleet fleet;
    fleet.reserve(config.numElevators);
    for (int id = 1; id <= config.numElevators; ++id) {
        fleet.push_back(
            std::make_unique<ElevatorUnit>(id, config.numFloors, motion, gateway, logger)
        );
    }
    return fleet;
}
