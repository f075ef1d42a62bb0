/**
 * @file FeedbackRepositoryFs.hpp
 * @brief File-backed implementation of IFeedbackRepository.
 */

#pragma once

#include <memory>
#include "domain/repositories/IFeedbackRepository.hpp"
#include "domain/repositories/IWorkLogRepository.hpp"
#include "infrastructure/TypedCollection.hpp"

namespace staffledger::infrastructure {

class FeedbackRepositoryFs : public domain::IFeedbackRepository {
public:
    FeedbackRepositoryFs(std::shared_ptr<RecordStore> store,
                         std::shared_ptr<domain::IWorkLogRepository> workLogs);

    std::optional<domain::Feedback> create(const std::string& managerId, const domain::NewFeedback& input) override;
    std::vector<domain::Feedback> findByEmployee(const std::string& employeeId) override;
    std::vector<domain::Feedback> findByWorkLog(const std::string& workLogId) override;
    std::vector<domain::Feedback> findByManager(const std::string& managerId) override;

private:
    template <typename Pred>
    std::vector<domain::Feedback> newestFirst(Pred pred) const;

    TypedCollection<domain::Feedback> m_feedback;
    std::shared_ptr<domain::IWorkLogRepository> m_workLogs;
};

} // namespace staffledger::infrastructure
