/**
 * @file Feedback.hpp
 * @brief Domain entity for manager feedback on a work log.
 */

#pragma once

#include <optional>
#include <string>

#include "value_objects/Timestamp.hpp"

namespace staffledger::domain {

/**
 * @struct Feedback
 * @brief employeeId and managerId are copied at creation from the work log's
 * owner and the author.
 */
struct Feedback {
    std::string id;
    std::string workLogId;
    std::string employeeId;
    std::string managerId;
    std::string feedbackText;
    std::optional<int> rating;      ///< 1..5 when present.
    Timestamp createdAt;
    Timestamp updatedAt;
};

struct NewFeedback {
    std::string workLogId;
    std::string feedbackText;
    std::optional<int> rating;
};

inline bool IsValidRating(const std::optional<int>& rating) {
    return !rating || (*rating >= 1 && *rating <= 5);
}

} // namespace staffledger::domain
