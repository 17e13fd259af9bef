#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

Logger::Logger(std::ostream& out, bool enabled)
    : out_(out), enabled_(enabled) {}

void Logger::log(const std::string& message) {
    if (!enabled_.load()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << getTimestamp() << " " << message << "\n";
}

void Logger::logUnitState(const UnitSnapshot& unit) {
    if (!enabled_.load()) return;

    std::ostringstream oss;
    oss << "[ELEVATOR " << unit.id << "] "
        << "floor=" << unit.currentFloor << " "
        << "state=" << stateToString(unit.state) << " "
        << "dir=" << directionToString(unit.direction);
    if (unit.destinationFloor) {
        oss << " dest=" << *unit.destinationFloor;
    }

    log(oss.str());
}

void Logger::logAssignment(const AssignmentResult& result, int fromFloor, int toFloor) {
    std::ostringstream oss;
    oss << "[ASSIGNMENT] elevator=" << result.elevatorId
        << " " << fromFloor << "->" << toFloor
        << " task=" << result.taskId
        << " eta=" << std::fixed << std::setprecision(1)
        << result.estimatedArrivalTime << "s";
    log(oss.str());
}

void Logger::logReplay(const std::string& key, const AssignmentResult& result) {
    log("[IDEMPOTENT] key=" + key + " replayed task=" + result.taskId);
}

void Logger::logTaskOutcome(const TaskRecord& record) {
    std::string line = "[TASK " + record.taskId + "] " +
                       taskStatusToString(record.status);
    if (record.status == TaskStatus::Failed) {
        line = "[ERROR] " + line + ": " + record.reason;
    }
    log(line);
}

void Logger::enable() { enabled_.store(true); }
void Logger::disable() { enabled_.store(false); }
bool Logger::isEnabled() const { return enabled_.load(); }

std::string Logger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << "[" << std::put_time(&local, "%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << millis << "]";
    return oss.str();
}
