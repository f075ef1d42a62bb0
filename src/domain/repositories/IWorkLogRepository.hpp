/**
 * @file IWorkLogRepository.hpp
 * @brief Interface for persisting work logs.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../WorkLog.hpp"

namespace staffledger::domain {

class IWorkLogRepository {
public:
    virtual ~IWorkLogRepository() = default;

    // Throws ValidationError for negative hours.
    virtual WorkLog create(const std::string& employeeId, const NewWorkLog& input) = 0;

    virtual std::optional<WorkLog> findById(const std::string& id) = 0;

    // Inclusive on both bounds, newest date first.
    virtual std::vector<WorkLog> findByEmployee(const std::string& employeeId,
                                                const std::optional<CalendarDate>& from = std::nullopt,
                                                const std::optional<CalendarDate>& to = std::nullopt) = 0;

    virtual std::optional<WorkLog> update(const std::string& id, const WorkLogUpdate& update) = 0;

    // Overwrites the single manager feedback slot on the log.
    virtual std::optional<WorkLog> setManagerFeedback(const std::string& id, const std::string& feedback) = 0;
};

} // namespace staffledger::domain
