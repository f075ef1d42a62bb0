/**
 * @file WorkLogRepositoryFs.hpp
 * @brief File-backed implementation of IWorkLogRepository.
 */

#pragma once

#include <memory>
#include "domain/repositories/IWorkLogRepository.hpp"
#include "infrastructure/TypedCollection.hpp"

namespace staffledger::infrastructure {

class WorkLogRepositoryFs : public domain::IWorkLogRepository {
public:
    explicit WorkLogRepositoryFs(std::shared_ptr<RecordStore> store);

    domain::WorkLog create(const std::string& employeeId, const domain::NewWorkLog& input) override;
    std::optional<domain::WorkLog> findById(const std::string& id) override;
    std::vector<domain::WorkLog> findByEmployee(const std::string& employeeId,
                                                const std::optional<domain::CalendarDate>& from,
                                                const std::optional<domain::CalendarDate>& to) override;
    std::optional<domain::WorkLog> update(const std::string& id, const domain::WorkLogUpdate& update) override;
    std::optional<domain::WorkLog> setManagerFeedback(const std::string& id, const std::string& feedback) override;

private:
    TypedCollection<domain::WorkLog> m_logs;
};

} // namespace staffledger::infrastructure
