/**
 * @file TaskStatus.hpp
 * @brief Value Object for the progress state of a logged task.
 */

#pragma once

#include <optional>
#include <string>

namespace staffledger::domain {

enum class TaskStatus {
    InProgress,
    Completed,
    Blocked
};

inline std::string TaskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Blocked: return "blocked";
        default: return "in_progress";
    }
}

inline std::optional<TaskStatus> TaskStatusFromString(const std::string& text) {
    if (text == "in_progress") return TaskStatus::InProgress;
    if (text == "completed") return TaskStatus::Completed;
    if (text == "blocked") return TaskStatus::Blocked;
    return std::nullopt;
}

} // namespace staffledger::domain
