#include "CLI.hpp"
#include "Errors.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

std::optional<EventType> parseEventType(const std::string& name) {
    for (EventType type : {EventType::ElevatorAssigned, EventType::CallCompleted,
                           EventType::CallFailed, EventType::MaintenanceChanged}) {
        if (eventTypeToString(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::string formatTime(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

} // namespace

CLI::CLI(Dispatcher& dispatcher, const InMemoryGateway& gateway,
         std::istream& in, std::ostream& out)
    : dispatcher_(dispatcher), gateway_(gateway), in_(in), out_(out) {}

void CLI::run() {
    printHelp();

    std::string line;
    while (running_.load() && std::getline(in_, line)) {
        if (line.empty()) continue;
        if (!processCommand(line)) {
            running_.store(false);
        }
    }
}

void CLI::stop() {
    running_.store(false);
}

void CLI::printHelp() {
    out_ << "\n=== Elevator Dispatch CLI ===\n"
         << "Commands:\n"
         << "  call <from> <to> [key]   - Request a ride (e.g., 'call 1 8 req-42')\n"
         << "  status                   - Print fleet status\n"
         << "  task <id>                - Print task status\n"
         << "  logs [limit] [type]      - Print recent audit events\n"
         << "  maint <elev> <on|off>    - Toggle maintenance mode\n"
         << "  help                     - Show this help\n"
         << "  quit                     - Exit\n"
         << "\n";
}

bool CLI::processCommand(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    std::string args;
    std::getline(iss, args);

    if (cmd == "call") {
        if (!parseCall(args)) {
            out_ << "Usage: call <from> <to> [idempotency_key]\n";
        }
    }
    else if (cmd == "status") {
        printStatus();
    }
    else if (cmd == "task") {
        if (!parseTask(args)) {
            out_ << "Usage: task <task_id>\n";
        }
    }
    else if (cmd == "logs") {
        if (!parseLogs(args)) {
            out_ << "Usage: logs [limit] [event_type]\n";
        }
    }
    else if (cmd == "maint") {
        if (!parseMaintenance(args)) {
            out_ << "Usage: maint <elevator_id> <on|off>\n";
        }
    }
    else if (cmd == "help") {
        printHelp();
    }
    else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        return false;
    }
    else {
        out_ << "Unknown command: " << cmd << ". Type 'help' for usage.\n";
    }
    return true;
}

void CLI::printStatus() {
    StatusSnapshot status = dispatcher_.getStatus();

    out_ << "\n========== Status at " << formatTime(status.timestamp) << " ==========\n";
    for (const auto& unit : status.units) {
        out_ << "Elevator " << unit.id << ": "
             << "Floor " << unit.currentFloor << ", "
             << stateToString(unit.state) << ", "
             << directionToString(unit.direction);
        if (unit.destinationFloor) {
            out_ << ", Dest " << *unit.destinationFloor;
        }
        out_ << ", Trips " << unit.tripsCompleted;
        if (unit.maintenance) {
            out_ << " [MAINTENANCE]";
        }
        out_ << "\n";
    }
    out_ << "Active tasks: " << status.activeTasks
         << "  Health: " << healthToString(status.health) << "\n"
         << "Calls: " << status.metrics.totalCalls
         << " (ok " << status.metrics.successfulAssignments
         << ", failed " << status.metrics.failedAssignments
         << ", replayed " << status.metrics.idempotentReplays << ")\n"
         << "==========================================\n\n";
}

bool CLI::parseCall(const std::string& args) {
    std::istringstream iss(args);
    int fromFloor, toFloor;

    if (!(iss >> fromFloor >> toFloor)) {
        return false;
    }

    std::optional<std::string> key;
    std::string token;
    if (iss >> token) {
        key = token;
    }

    try {
        AssignmentResult result = dispatcher_.assign(fromFloor, toFloor, "cli", key);
        out_ << "Elevator " << result.elevatorId << " assigned, task "
             << result.taskId << ", ETA " << std::fixed << std::setprecision(1)
             << result.estimatedArrivalTime << "s\n";
        out_.unsetf(std::ios::fixed);
    } catch (const DispatchError& e) {
        out_ << "Error: " << e.what() << "\n";
    }
    return true;
}

bool CLI::parseTask(const std::string& args) {
    std::istringstream iss(args);
    std::string taskId;
    if (!(iss >> taskId)) {
        return false;
    }

    TaskRecord record = dispatcher_.getTaskStatus(taskId);
    out_ << "Task " << taskId << ": " << taskStatusToString(record.status);
    if (record.status == TaskStatus::Failed) {
        out_ << " (" << record.reason << ")";
    }
    out_ << "\n";
    return true;
}

bool CLI::parseLogs(const std::string& args) {
    std::istringstream iss(args);
    int limit = 20;
    std::optional<EventType> type;

    std::string token;
    if (iss >> token) {
        try {
            limit = std::stoi(token);
        } catch (const std::invalid_argument&) {
            return false;
        } catch (const std::out_of_range&) {
            return false;
        }
        if (limit < 1) {
            return false;
        }
        if (iss >> token) {
            type = parseEventType(token);
            if (!type) {
                return false;
            }
        }
    }

    auto events = gateway_.events(static_cast<std::size_t>(limit), 0, type);
    for (const auto& event : events) {
        out_ << formatTime(event.timestamp) << " "
             << severityToString(event.severity) << " "
             << eventTypeToString(event.type);
        if (event.unitId) {
            out_ << " elevator=" << *event.unitId;
        }
        out_ << " source=" << event.source << " " << event.detail << "\n";
    }
    if (events.empty()) {
        out_ << "(no events)\n";
    }
    return true;
}

bool CLI::parseMaintenance(const std::string& args) {
    std::istringstream iss(args);
    int unitId;
    std::string mode;

    if (!(iss >> unitId >> mode) || (mode != "on" && mode != "off")) {
        return false;
    }

    try {
        dispatcher_.setMaintenance(unitId, mode == "on");
        out_ << "Elevator " << unitId << " maintenance " << mode << "\n";
    } catch (const DispatchError& e) {
        out_ << "Error: " << e.what() << "\n";
    }
    return true;
}
