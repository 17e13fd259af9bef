#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// ============== Dispatch Errors ==============

class DispatchError : public std::runtime_error {
public:
    explicit DispatchError(const std::string& message)
        : std::runtime_error(message) {}
};

// Floor outside [1, numFloors]
class InvalidFloorError : public DispatchError {
public:
    InvalidFloorError(const std::string& field, int value, int maxFloor)
        : DispatchError(field + " " + std::to_string(value) +
                        " out of range 1-" + std::to_string(maxFloor)) {}
};

// No idle unit and no compatible en-route unit; caller may retry
class NoAvailableUnitError : public DispatchError {
public:
    NoAvailableUnitError()
        : DispatchError("No elevators currently available") {}
};

// Same idempotency key replayed with a different request
class IdempotencyConflictError : public DispatchError {
public:
    explicit IdempotencyConflictError(const std::string& key)
        : DispatchError("Idempotency key '" + key +
                        "' was already used for a different request") {}
};

class UnitFaultError : public DispatchError {
public:
    UnitFaultError(int unitId, const std::string& reason)
        : DispatchError("Elevator " + std::to_string(unitId) +
                        " fault: " + reason) {}
};

class UnknownUnitError : public DispatchError {
public:
    explicit UnknownUnitError(int unitId)
        : DispatchError("Invalid elevator ID: " + std::to_string(unitId)) {}
};

#endif // ERRORS_HPP
