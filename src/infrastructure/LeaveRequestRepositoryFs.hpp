/**
 * @file LeaveRequestRepositoryFs.hpp
 * @brief File-backed implementation of ILeaveRequestRepository.
 */

#pragma once

#include <memory>
#include "domain/repositories/IEmployeeRepository.hpp"
#include "domain/repositories/ILeaveRequestRepository.hpp"
#include "infrastructure/TypedCollection.hpp"

namespace staffledger::infrastructure {

class LeaveRequestRepositoryFs : public domain::ILeaveRequestRepository {
public:
    /**
     * @param employees Used once per create() to snapshot the filer's manager.
     */
    LeaveRequestRepositoryFs(std::shared_ptr<RecordStore> store,
                             std::shared_ptr<domain::IEmployeeRepository> employees);

    domain::LeaveRequest create(const std::string& employeeId, const domain::NewLeaveRequest& input) override;
    std::optional<domain::LeaveRequest> findById(const std::string& id) override;
    std::vector<domain::LeaveRequest> findByEmployee(const std::string& employeeId) override;
    std::vector<domain::LeaveRequest> findByManager(const std::string& managerId) override;
    std::vector<domain::LeaveRequest> findByStatus(domain::LeaveStatus status) override;
    std::optional<domain::LeaveRequest> update(const std::string& id, const domain::LeaveRequestUpdate& update) override;
    std::optional<domain::LeaveRequest> decide(const std::string& id, const domain::LeaveDecision& decision) override;

private:
    TypedCollection<domain::LeaveRequest> m_requests;
    std::shared_ptr<domain::IEmployeeRepository> m_employees;
};

} // namespace staffledger::infrastructure
