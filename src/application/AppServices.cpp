/**
 * @file AppServices.cpp
 * @brief Wiring of repositories, policy and services over one data directory.
 */

#include "application/AppServices.hpp"

#include <iostream>

#include "infrastructure/AuditTrailRepositoryFs.hpp"
#include "infrastructure/EmployeeRepositoryFs.hpp"
#include "infrastructure/FeedbackRepositoryFs.hpp"
#include "infrastructure/LeaveRequestRepositoryFs.hpp"
#include "infrastructure/SettingsRepositoryFs.hpp"
#include "infrastructure/WorkLogRepositoryFs.hpp"

namespace staffledger::application {

AppServices BuildAppServices(const infrastructure::StoreConfig& config) {
    AppServices services;
    services.store = std::make_shared<infrastructure::RecordStore>(config.dataDir, config.prettyPrint);
    std::cerr << "[AppServices] Data directory: " << services.store->dataDir().string() << std::endl;

    services.employees = std::make_shared<infrastructure::EmployeeRepositoryFs>(services.store);
    services.workLogs = std::make_shared<infrastructure::WorkLogRepositoryFs>(services.store);
    services.leaveRequests = std::make_shared<infrastructure::LeaveRequestRepositoryFs>(services.store, services.employees);
    services.feedback = std::make_shared<infrastructure::FeedbackRepositoryFs>(services.store, services.workLogs);
    services.auditTrail = std::make_shared<infrastructure::AuditTrailRepositoryFs>(services.store);
    services.settings = std::make_shared<infrastructure::SettingsRepositoryFs>(services.store);

    services.policy = std::make_shared<AuthorizationPolicy>(services.employees, services.settings);
    services.auditRecorder = std::make_shared<AuditRecorder>(services.auditTrail, config.auditQueueLimit);

    services.employeeService = std::make_unique<EmployeeService>(services.employees, services.policy, services.auditRecorder);
    services.workLogService = std::make_unique<WorkLogService>(services.workLogs, services.policy, services.auditRecorder);
    services.leaveService = std::make_unique<LeaveService>(services.leaveRequests, services.policy, services.auditRecorder);
    services.feedbackService = std::make_unique<FeedbackService>(services.feedback, services.workLogs,
                                                                 services.policy, services.auditRecorder);
    services.adminService = std::make_unique<AdminService>(services.settings, services.auditTrail, services.auditRecorder);
    return services;
}

} // namespace staffledger::application
