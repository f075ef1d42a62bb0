/**
 * @file EmployeeRepositoryFs.hpp
 * @brief File-backed implementation of IEmployeeRepository.
 */

#pragma once

#include <memory>
#include "domain/repositories/IEmployeeRepository.hpp"
#include "infrastructure/TypedCollection.hpp"

namespace staffledger::infrastructure {

class EmployeeRepositoryFs : public domain::IEmployeeRepository {
public:
    explicit EmployeeRepositoryFs(std::shared_ptr<RecordStore> store);

    domain::Employee create(const domain::NewEmployee& input) override;
    std::optional<domain::Employee> findById(const std::string& id) override;
    std::optional<domain::Employee> findByEmail(const std::string& email) override;
    std::vector<domain::Employee> findAll() override;
    std::vector<domain::Employee> findDirectReports(const std::string& managerId) override;
    std::optional<domain::Employee> update(const std::string& id, const domain::EmployeeUpdate& update) override;
    bool deactivate(const std::string& id) override;

private:
    TypedCollection<domain::Employee> m_employees;
};

} // namespace staffledger::infrastructure
