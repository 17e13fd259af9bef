#include "TaskRegistry.hpp"
#include <stdexcept>

namespace {
const std::string kTaskPrefix = "elevator_";
}

TaskRegistry::TaskRegistry(std::size_t historyLimit)
    : historyLimit_(historyLimit) {}

std::string TaskRegistry::registerTask(int elevatorId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = kTaskPrefix + std::to_string(elevatorId) + "_" +
                     std::to_string(nextSequence_++);

    TaskRecord record;
    record.taskId = id;
    record.elevatorId = elevatorId;
    record.status = TaskStatus::Running;
    active_.emplace(id, record);
    return id;
}

void TaskRegistry::discard(const std::string& taskId) {
    finish(taskId, TaskStatus::Failed, "assignment rolled back");
}

TaskRecord TaskRegistry::complete(const std::string& taskId) {
    return finish(taskId, TaskStatus::Completed, "");
}

TaskRecord TaskRegistry::fail(const std::string& taskId, const std::string& reason) {
    return finish(taskId, TaskStatus::Failed, reason);
}

TaskRecord TaskRegistry::finish(const std::string& taskId, TaskStatus status,
                                const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    TaskRecord record;
    auto it = active_.find(taskId);
    if (it != active_.end()) {
        record = it->second;
        active_.erase(it);
    } else {
        record.taskId = taskId;
    }
    record.status = status;
    record.reason = reason;

    if (historyLimit_ == 0) {
        return record;
    }
    if (finished_.emplace(taskId, record).second) {
        finishedOrder_.push_back(taskId);
    }
    while (finishedOrder_.size() > historyLimit_) {
        finished_.erase(finishedOrder_.front());
        finishedOrder_.pop_front();
    }
    return record;
}

TaskRecord TaskRegistry::lookup(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto it = active_.find(taskId); it != active_.end()) {
        return it->second;
    }
    if (auto it = finished_.find(taskId); it != finished_.end()) {
        return it->second;
    }

    TaskRecord record;
    record.taskId = taskId;
    // Pruned ids read as completed by convention
    record.status = wasIssued(taskId) ? TaskStatus::Completed : TaskStatus::Unknown;
    return record;
}

std::size_t TaskRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

bool TaskRegistry::wasIssued(const std::string& taskId) const {
    if (taskId.compare(0, kTaskPrefix.size(), kTaskPrefix) != 0) {
        return false;
    }
    auto sep = taskId.rfind('_');
    if (sep == std::string::npos || sep + 1 >= taskId.size() ||
        sep < kTaskPrefix.size()) {
        return false;
    }

    std::string digits = taskId.substr(sep + 1);
    if (digits.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        unsigned long seq = std::stoul(digits);
        return seq >= 1 && seq < nextSequence_;
    } catch (const std::out_of_range&) {
        return false;
    }
}
