/**
 * @file FeedbackRepositoryFs.cpp
 * @brief Implementation of FeedbackRepositoryFs.
 */

#include "infrastructure/FeedbackRepositoryFs.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Credentials.hpp"

#include <algorithm>

namespace staffledger::infrastructure {

using namespace staffledger::domain;

FeedbackRepositoryFs::FeedbackRepositoryFs(std::shared_ptr<RecordStore> store,
                                           std::shared_ptr<IWorkLogRepository> workLogs)
    : m_feedback(std::move(store)), m_workLogs(std::move(workLogs)) {}

std::optional<Feedback> FeedbackRepositoryFs::create(const std::string& managerId, const NewFeedback& input) {
    if (!IsValidRating(input.rating)) {
        throw ValidationError("Rating must be between 1 and 5");
    }

    // Read the log first, write the feedback last: no cross-collection atomicity.
    auto log = m_workLogs->findById(input.workLogId);
    if (!log) {
        return std::nullopt;
    }

    return m_feedback.insert([&](const std::vector<Feedback>&) {
        Feedback feedback;
        feedback.id = Credentials::NewId();
        feedback.workLogId = input.workLogId;
        feedback.employeeId = log->employeeId;
        feedback.managerId = managerId;
        feedback.feedbackText = input.feedbackText;
        feedback.rating = input.rating;
        feedback.createdAt = Now();
        feedback.updatedAt = feedback.createdAt;
        return feedback;
    });
}

template <typename Pred>
std::vector<Feedback> FeedbackRepositoryFs::newestFirst(Pred pred) const {
    auto items = m_feedback.filter(pred);
    std::stable_sort(items.begin(), items.end(), [](const Feedback& a, const Feedback& b) {
        return a.createdAt > b.createdAt;
    });
    return items;
}

std::vector<Feedback> FeedbackRepositoryFs::findByEmployee(const std::string& employeeId) {
    return newestFirst([&](const Feedback& f) { return f.employeeId == employeeId; });
}

std::vector<Feedback> FeedbackRepositoryFs::findByWorkLog(const std::string& workLogId) {
    return newestFirst([&](const Feedback& f) { return f.workLogId == workLogId; });
}

std::vector<Feedback> FeedbackRepositoryFs::findByManager(const std::string& managerId) {
    return newestFirst([&](const Feedback& f) { return f.managerId == managerId; });
}

} // namespace staffledger::infrastructure
