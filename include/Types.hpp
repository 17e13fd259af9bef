#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// ============== Enums =============

enum class Direction {
    Up,
    Down,
    None
};

enum class ElevatorState {
    Idle,           // Parked, no reservation
    Moving,         // Traveling between floors (or reserved to)
    DoorOpening,    // Arrived, doors cycling open
    DoorClosing,    // Doors cycling closed
    Error           // Faulted, needs manual reset
};

enum class TaskStatus {
    Running,
    Completed,
    Failed,
    Unknown
};

enum class SystemHealth {
    Healthy,
    Busy
};

enum class EventType {
    ElevatorAssigned,
    CallCompleted,
    CallFailed,
    MaintenanceChanged
};

enum class Severity {
    Info,
    Warning,
    Error
};

// ============== Configuration ==============

struct Config {
    int numFloors = 10;
    int numElevators = 5;
    int floorTransitMs = 5000;
    int doorMs = 2000;
    int idempotencyTtlMs = 600000;
    int workersPerUnit = 2;
    std::size_t taskHistoryLimit = 1024;
    bool verbose = true;
};

// ============== Records ==============

struct UnitSnapshot {
    int id = 0;
    int currentFloor = 1;
    ElevatorState state = ElevatorState::Idle;
    Direction direction = Direction::None;
    std::optional<int> destinationFloor;
    int tripsCompleted = 0;
    bool maintenance = false;
};

struct AssignmentResult {
    int elevatorId = 0;
    std::string taskId;
    double estimatedArrivalTime = 0.0;  // seconds
};

struct TaskRecord {
    std::string taskId;
    int elevatorId = 0;
    TaskStatus status = TaskStatus::Unknown;
    std::string reason;  // Set when Failed
};

struct AssignmentMetrics {
    long totalCalls = 0;
    long successfulAssignments = 0;
    long failedAssignments = 0;
    long idempotentReplays = 0;
};

struct StatusSnapshot {
    std::vector<UnitSnapshot> units;
    std::size_t activeTasks = 0;
    SystemHealth health = SystemHealth::Healthy;
    AssignmentMetrics metrics;
    std::chrono::system_clock::time_point timestamp =
        std::chrono::system_clock::now();
};

struct AuditEvent {
    EventType type = EventType::ElevatorAssigned;
    std::string detail;
    std::string source;
    std::optional<int> unitId;
    Severity severity = Severity::Info;
    std::chrono::system_clock::time_point timestamp =
        std::chrono::system_clock::now();
};

// ============== Utility Functions ==============

inline std::string directionToString(Direction dir) {
    switch (dir) {
        case Direction::Up: return "UP";
        case Direction::Down: return "DOWN";
        case Direction::None: return "NONE";
    }
    return "UNKNOWN";
}

inline std::string stateToString(ElevatorState state) {
    switch (state) {
        case ElevatorState::Idle: return "IDLE";
        case ElevatorState::Moving: return "MOVING";
        case ElevatorState::DoorOpening: return "DOOR_OPENING";
        case ElevatorState::DoorClosing: return "DOOR_CLOSING";
        case ElevatorState::Error: return "ERROR";
    }
    return "UNKNOWN";
}

inline std::string taskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Unknown: return "unknown";
    }
    return "unknown";
}

inline std::string healthToString(SystemHealth health) {
    return health == SystemHealth::Busy ? "BUSY" : "HEALTHY";
}

inline std::string eventTypeToString(EventType type) {
    switch (type) {
        case EventType::ElevatorAssigned: return "ELEVATOR_ASSIGNED";
        case EventType::CallCompleted: return "CALL_COMPLETED";
        case EventType::CallFailed: return "CALL_FAILED";
        case EventType::MaintenanceChanged: return "MAINTENANCE_CHANGED";
    }
    return "UNKNOWN";
}

inline std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::Info: return "INFO";
        case Severity::Warning: return "WARNING";
        case Severity::Error: return "ERROR";
    }
    return "INFO";
}

#endif // TYPES_HPP
