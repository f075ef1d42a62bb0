/**
 * @file WorkLog.hpp
 * @brief Domain entity for a unit of logged work.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "value_objects/CalendarDate.hpp"
#include "value_objects/FieldPatch.hpp"
#include "value_objects/TaskStatus.hpp"
#include "value_objects/Timestamp.hpp"

namespace staffledger::domain {

struct WorkLogAttachment {
    std::string filename;
    std::string url;
    Timestamp uploadedAt;
};

/**
 * @struct WorkLog
 * @brief Owned by exactly one employee (employeeId).
 */
struct WorkLog {
    std::string id;
    std::string employeeId;
    CalendarDate date;
    std::string taskDescription;
    double timeSpent = 0.0;                 ///< Hours, non-negative.
    TaskStatus status = TaskStatus::InProgress;
    std::optional<std::string> project;
    std::optional<std::string> category;
    std::vector<WorkLogAttachment> attachments;
    std::optional<std::string> notes;
    std::optional<std::string> managerFeedback;
    Timestamp createdAt;
    Timestamp updatedAt;

    /// Derived per read for the acting employee. Never persisted.
    bool canEdit = false;
};

struct NewWorkLog {
    CalendarDate date;
    std::string taskDescription;
    double timeSpent = 0.0;
    TaskStatus status = TaskStatus::InProgress;
    std::optional<std::string> project;
    std::optional<std::string> category;
    std::optional<std::string> notes;
};

struct WorkLogUpdate {
    std::optional<std::string> taskDescription;
    std::optional<double> timeSpent;
    std::optional<TaskStatus> status;
    NullablePatch<std::string> project;
    NullablePatch<std::string> category;
    NullablePatch<std::string> notes;
};

inline void ApplyUpdate(WorkLog& log, const WorkLogUpdate& update) {
    ApplyPatch(log.taskDescription, update.taskDescription);
    ApplyPatch(log.timeSpent, update.timeSpent);
    ApplyPatch(log.status, update.status);
    ApplyPatch(log.project, update.project);
    ApplyPatch(log.category, update.category);
    ApplyPatch(log.notes, update.notes);
}

} // namespace staffledger::domain
