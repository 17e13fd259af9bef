#ifndef ELEVATOR_UNIT_HPP
#define ELEVATOR_UNIT_HPP

#include "Types.hpp"
#include "Logger.hpp"
#include "Persistence.hpp"
#include <mutex>
#include <optional>

// ============== Motion Control ==============
// Physical timing of a car. Each call blocks for the duration of one
// phase; an exception thrown here is a unit fault.

class IMotionControl {
public:
    virtual ~IMotionControl() = default;

    virtual void travelOneFloor(int unitId, int fromFloor, int toFloor) = 0;
    virtual void cycleDoor(int unitId, int floor, ElevatorState phase) = 0;
};

class SleepingMotionControl : public IMotionControl {
private:
    int floorTransitMs_;
    int doorMs_;

public:
    SleepingMotionControl(int floorTransitMs, int doorMs);

    void travelOneFloor(int unitId, int fromFloor, int toFloor) override;
    void cycleDoor(int unitId, int floor, ElevatorState phase) override;
};

// ============== Elevator Unit ==============

class ElevatorUnit {
private:
    const int id_;
    const int numFloors_;
    int currentFloor_;
    ElevatorState state_ = ElevatorState::Idle;
    Direction direction_ = Direction::None;
    std::optional<int> destinationFloor_;
    int tripsCompleted_ = 0;
    bool maintenance_ = false;
    int reservations_ = 0;  // Accepted assignments not yet released
    Direction reservedDirection_ = Direction::None;
    std::optional<int> reservedDestination_;  // Farthest accepted drop-off

    IMotionControl& motion_;
    IPersistenceGateway& gateway_;
    Logger& logger_;

    mutable std::mutex mutex_;    // Guards the fields above
    std::mutex motionMutex_;      // Held for a whole moveTo

public:
    ElevatorUnit(int id, int numFloors, IMotionControl& motion,
                 IPersistenceGateway& gateway, Logger& logger,
                 int startFloor = 1);

    ElevatorUnit(const ElevatorUnit&) = delete;
    ElevatorUnit& operator=(const ElevatorUnit&) = delete;

    // Getters (thread-safe)
    int getId() const { return id_; }
    int getCurrentFloor() const;
    ElevatorState getState() const;
    Direction getDirection() const;
    std::optional<int> getDestinationFloor() const;
    int getTripsCompleted() const;
    bool isInMaintenance() const;
    UnitSnapshot snapshot() const;

    // Blocking: runs the full travel and door cycle to floor. Ends IDLE unless
    // an accepted assignment is still outstanding, in which case the unit
    // resumes its reserved route.
    void moveTo(int floor);

    // Dispatcher-side bookkeeping
    void reserve(Direction dir, int destination);
    void cancelReservation(const UnitSnapshot& previous);
    void releaseReservation(bool tripCompleted = true);
    void markFault(const std::string& reason);
    void setMaintenance(bool enabled);

private:
    void setMotion(ElevatorState state, Direction dir, std::optional<int> destination);
    void finishLeg();
    void clearReservedRouteLocked();
    void publish(const UnitSnapshot& unit);
    UnitSnapshot snapshotLocked() const;
};

#endif // ELEVATOR_UNIT_HPP
