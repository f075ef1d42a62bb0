/**
 * @file FeedbackService.hpp
 * @brief Application Service for manager feedback on work logs.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AuditRecorder.hpp"
#include "application/AuthorizationPolicy.hpp"
#include "domain/repositories/IFeedbackRepository.hpp"
#include "domain/repositories/IWorkLogRepository.hpp"

namespace staffledger::application {

class FeedbackService {
public:
    FeedbackService(std::shared_ptr<domain::IFeedbackRepository> feedback,
                    std::shared_ptr<domain::IWorkLogRepository> workLogs,
                    std::shared_ptr<AuthorizationPolicy> policy,
                    std::shared_ptr<AuditRecorder> audit);

    // std::nullopt when the work log does not exist.
    std::optional<domain::Feedback> giveFeedback(const domain::Employee& actor, const domain::NewFeedback& input);

    std::vector<domain::Feedback> feedbackForEmployee(const domain::Employee& actor, const std::string& employeeId);
    std::optional<std::vector<domain::Feedback>> feedbackForWorkLog(const domain::Employee& actor,
                                                                    const std::string& workLogId);
    std::vector<domain::Feedback> givenBy(const domain::Employee& actor);

private:
    std::shared_ptr<domain::IFeedbackRepository> m_feedback;
    std::shared_ptr<domain::IWorkLogRepository> m_workLogs;
    std::shared_ptr<AuthorizationPolicy> m_policy;
    std::shared_ptr<AuditRecorder> m_audit;
};

} // namespace staffledger::application
