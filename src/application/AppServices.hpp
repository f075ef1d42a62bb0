/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>

#include "application/AdminService.hpp"
#include "application/AuditRecorder.hpp"
#include "application/AuthorizationPolicy.hpp"
#include "application/EmployeeService.hpp"
#include "application/FeedbackService.hpp"
#include "application/LeaveService.hpp"
#include "application/WorkLogService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/RecordStore.hpp"

namespace staffledger::application {

struct AppServices {
    std::shared_ptr<infrastructure::RecordStore> store;

    std::shared_ptr<domain::IEmployeeRepository> employees;
    std::shared_ptr<domain::IWorkLogRepository> workLogs;
    std::shared_ptr<domain::ILeaveRequestRepository> leaveRequests;
    std::shared_ptr<domain::IFeedbackRepository> feedback;
    std::shared_ptr<domain::IAuditTrailRepository> auditTrail;
    std::shared_ptr<domain::ISettingsRepository> settings;

    std::shared_ptr<AuthorizationPolicy> policy;
    std::shared_ptr<AuditRecorder> auditRecorder;

    std::unique_ptr<EmployeeService> employeeService;
    std::unique_ptr<WorkLogService> workLogService;
    std::unique_ptr<LeaveService> leaveService;
    std::unique_ptr<FeedbackService> feedbackService;
    std::unique_ptr<AdminService> adminService;
};

/**
 * @brief Composition root. Every repository shares one RecordStore so that
 * all mutators of a collection go through the same exclusive section.
 */
AppServices BuildAppServices(const infrastructure::StoreConfig& config);

} // namespace staffledger::application
