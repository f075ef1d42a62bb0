/**
 * @file IFeedbackRepository.hpp
 * @brief Interface for persisting work log feedback.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../Feedback.hpp"

namespace staffledger::domain {

class IFeedbackRepository {
public:
    virtual ~IFeedbackRepository() = default;

    // std::nullopt when the work log does not exist. ValidationError for a
    // rating outside [1,5].
    virtual std::optional<Feedback> create(const std::string& managerId, const NewFeedback& input) = 0;

    // All three are newest first.
    virtual std::vector<Feedback> findByEmployee(const std::string& employeeId) = 0;
    virtual std::vector<Feedback> findByWorkLog(const std::string& workLogId) = 0;
    virtual std::vector<Feedback> findByManager(const std::string& managerId) = 0;
};

} // namespace staffledger::domain
