#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "Types.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

// ============== Logger ==============
// Shared by reference between the dispatcher, its units and the CLI.

class Logger {
private:
    mutable std::mutex mutex_;
    std::ostream& out_;
    std::atomic<bool> enabled_;

public:
    explicit Logger(std::ostream& out = std::cerr, bool enabled = true);

    void log(const std::string& message);
    void logUnitState(const UnitSnapshot& unit);
    void logAssignment(const AssignmentResult& result, int fromFloor, int toFloor);
    void logReplay(const std::string& key, const AssignmentResult& result);
    void logTaskOutcome(const TaskRecord& record);

    void enable();
    void disable();
    bool isEnabled() const;

private:
    std::string getTimestamp() const;
};

#endif // LOGGER_HPP
