#include "ElevatorUnit.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

// ============== Sleeping Motion Control ==============

SleepingMotionControl::SleepingMotionControl(int floorTransitMs, int doorMs)
    : floorTransitMs_(floorTransitMs), doorMs_(doorMs) {}

void SleepingMotionControl::travelOneFloor(int unitId, int fromFloor, int toFloor) {
    (void)unitId;
    (void)fromFloor;
    (void)toFloor;
    std::this_thread::sleep_for(std::chrono::milliseconds(floorTransitMs_));
}

void SleepingMotionControl::cycleDoor(int unitId, int floor, ElevatorState phase) {
    (void)unitId;
    (void)floor;
    (void)phase;
    std::this_thread::sleep_for(std::chrono::milliseconds(doorMs_));
}

// ============== Elevator Unit Implementation ==============

ElevatorUnit::ElevatorUnit(int id, int numFloors, IMotionControl& motion,
                           IPersistenceGateway& gateway, Logger& logger,
                           int startFloor)
    : id_(id), numFloors_(numFloors), currentFloor_(startFloor),
      motion_(motion), gateway_(gateway), logger_(logger) {
    if (startFloor < 1 || startFloor > numFloors) {
        throw InvalidFloorError("start_floor", startFloor, numFloors);
    }
    publish(snapshotLocked());
}

int ElevatorUnit::getCurrentFloor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentFloor_;
}

ElevatorState ElevatorUnit::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Direction ElevatorUnit::getDirection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return direction_;
}

std::optional<int> ElevatorUnit::getDestinationFloor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return destinationFloor_;
}

int ElevatorUnit::getTripsCompleted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tripsCompleted_;
}

bool ElevatorUnit::isInMaintenance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maintenance_;
}

UnitSnapshot ElevatorUnit::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotLocked();
}

UnitSnapshot ElevatorUnit::snapshotLocked() const {
    UnitSnapshot s;
    s.id = id_;
    s.currentFloor = currentFloor_;
    s.state = state_;
    s.direction = direction_;
    s.destinationFloor = destinationFloor_;
    s.tripsCompleted = tripsCompleted_;
    s.maintenance = maintenance_;
    return s;
}

void ElevatorUnit::moveTo(int floor) {
    if (floor < 1 || floor > numFloors_) {
        throw InvalidFloorError("floor", floor, numFloors_);
    }

    std::lock_guard<std::mutex> motionLock(motionMutex_);

    int current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ElevatorState::Error) {
            throw UnitFaultError(id_, "unit is in ERROR state");
        }
        current = currentFloor_;
    }
    if (current == floor) {
        return;
    }

    Direction dir = (floor > current) ? Direction::Up : Direction::Down;
    int step = (dir == Direction::Up) ? 1 : -1;
    setMotion(ElevatorState::Moving, dir, floor);

    while (current != floor) {
        motion_.travelOneFloor(id_, current, current + step);
        current += step;

        UnitSnapshot s;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            currentFloor_ = current;
            s = snapshotLocked();
        }
        publish(s);
        logger_.logUnitState(s);
    }

    // Arrival sequence
    setMotion(ElevatorState::DoorOpening, dir, floor);
    motion_.cycleDoor(id_, floor, ElevatorState::DoorOpening);

    setMotion(ElevatorState::DoorClosing, dir, floor);
    motion_.cycleDoor(id_, floor, ElevatorState::DoorClosing);

    finishLeg();
}

void ElevatorUnit::finishLeg() {
    UnitSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reservations_ > 0 && state_ != ElevatorState::Error) {
            state_ = ElevatorState::Moving;
            direction_ = reservedDirection_;
            destinationFloor_ = reservedDestination_;
        } else {
            state_ = ElevatorState::Idle;
            direction_ = Direction::None;
            destinationFloor_.reset();
        }
        s = snapshotLocked();
    }
    publish(s);
}

void ElevatorUnit::reserve(Direction dir, int destination) {
    UnitSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reservations_ > 0 && reservedDirection_ == dir && reservedDestination_) {
            int current = *reservedDestination_;
            reservedDestination_ = (dir == Direction::Up) ? std::max(current, destination)
                                                          : std::min(current, destination);
        } else {
            reservedDirection_ = dir;
            reservedDestination_ = destination;
        }
        direction_ = reservedDirection_;
        destinationFloor_ = reservedDestination_;
        state_ = ElevatorState::Moving;
        ++reservations_;
        s = snapshotLocked();
    }
    publish(s);
}

void ElevatorUnit::cancelReservation(const UnitSnapshot& previous) {
    UnitSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = previous.state;
        direction_ = previous.direction;
        destinationFloor_ = previous.destinationFloor;
        reservations_ = std::max(0, reservations_ - 1);
        if (reservations_ == 0) {
            clearReservedRouteLocked();
        } else {
            reservedDirection_ = previous.direction;
            reservedDestination_ = previous.destinationFloor;
        }
        s = snapshotLocked();
    }
    publish(s);
}

void ElevatorUnit::releaseReservation(bool tripCompleted) {
    UnitSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reservations_ = std::max(0, reservations_ - 1);
        if (tripCompleted) {
            ++tripsCompleted_;
        }
        // Another accepted call may still be queued on this car
        if (reservations_ == 0) {
            clearReservedRouteLocked();
            if (state_ != ElevatorState::Error) {
                state_ = ElevatorState::Idle;
                direction_ = Direction::None;
                destinationFloor_.reset();
            }
        }
        s = snapshotLocked();
    }
    publish(s);
}

void ElevatorUnit::markFault(const std::string& reason) {
    UnitSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ElevatorState::Error;
        reservations_ = std::max(0, reservations_ - 1);
        if (reservations_ == 0) {
            clearReservedRouteLocked();
        }
        s = snapshotLocked();
    }
    logger_.log("[ERROR] Elevator " + std::to_string(id_) + " faulted: " + reason);
    publish(s);
}

void ElevatorUnit::setMaintenance(bool enabled) {
    UnitSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        maintenance_ = enabled;
        s = snapshotLocked();
    }
    publish(s);
}

void ElevatorUnit::setMotion(ElevatorState state, Direction dir,
                             std::optional<int> destination) {
    UnitSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
        direction_ = dir;
        destinationFloor_ = destination;
        s = snapshotLocked();
    }
    publish(s);
}

void ElevatorUnit::clearReservedRouteLocked() {
    reservedDirection_ = Direction::None;
    reservedDestination_.reset();
}

void ElevatorUnit::publish(const UnitSnapshot& unit) {
    try {
        gateway_.upsertUnitState(unit);
    } catch (const std::exception& e) {
        logger_.log("[WARN] Elevator " + std::to_string(id_) +
                    " state not persisted: " + e.what());
    }
}
