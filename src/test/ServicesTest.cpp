#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "application/AppServices.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Credentials.hpp"

using namespace staffledger;
using namespace staffledger::domain;
using namespace staffledger::application;
namespace fs = std::filesystem;

namespace {

NewEmployee MakeEmployee(const std::string& email, Role role, std::optional<std::string> managerId = std::nullopt) {
    NewEmployee e;
    e.email = email;
    e.password = "pw-" + email;
    e.firstName = "First";
    e.lastName = "Last";
    e.role = role;
    e.managerId = std::move(managerId);
    e.hireDate = CalendarDate(2021, 9, 1);
    return e;
}

template <typename Fn>
bool Denied(Fn fn) {
    try {
        fn();
    } catch (const PermissionDeniedError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Services Test..." << std::endl;
    unsetenv(infrastructure::ConfigLoader::kDataDirEnv);

    fs::path testRoot = fs::temp_directory_path() / ("staffledger_services_" + infrastructure::Credentials::NewId());
    infrastructure::StoreConfig config;
    config.dataDir = testRoot;
    AppServices services = BuildAppServices(config);

    // Bootstrap an admin directly, then build the organization through the services.
    Employee admin = services.employees->create(MakeEmployee("admin@example.com", Role::Admin));
    Employee manager = services.employeeService->createEmployee(admin, MakeEmployee("m@example.com", Role::Manager));
    Employee staff = services.employeeService->createEmployee(admin, MakeEmployee("a@example.com", Role::Employee, manager.id));
    Employee outsider = services.employeeService->createEmployee(admin, MakeEmployee("x@example.com", Role::Employee));

    assert(Denied([&] { services.employeeService->createEmployee(staff, MakeEmployee("y@example.com", Role::Employee)); }));
    assert(Denied([&] { services.employeeService->listEmployees(manager); }));
    assert(services.employeeService->listEmployees(admin).size() == 4);

    auto bulk = services.employeeService->bulkCreate(admin, {MakeEmployee("b1@example.com", Role::Employee),
                                                             MakeEmployee("a@example.com", Role::Employee)});
    assert(bulk.createdIds.size() == 1);
    assert(bulk.errors.size() == 1 && bulk.errors[0].row == 2 && bulk.errors[0].email == "a@example.com");
    std::cout << "[PASS] Employee administration" << std::endl;

    // Authentication.
    auto session = services.employeeService->authenticate("a@example.com", "pw-a@example.com");
    assert(session && session->id == staff.id);
    assert(!services.employeeService->authenticate("a@example.com", "wrong"));
    assert(!services.employeeService->authenticate("nobody@example.com", "pw"));
    services.employeeService->logout(*session);

    // Field-level update rules.
    EmployeeUpdate rename;
    rename.firstName = std::string("Alice");
    assert(services.employeeService->updateEmployee(staff, staff.id, rename)->firstName == "Alice");

    EmployeeUpdate promote;
    promote.role = Role::Manager;
    assert(Denied([&] { services.employeeService->updateEmployee(staff, staff.id, promote); }));

    EmployeeUpdate relocate;
    relocate.department = std::optional<std::string>("Support");
    assert(Denied([&] { services.employeeService->updateEmployee(staff, staff.id, relocate); }));
    assert(services.employeeService->updateEmployee(manager, staff.id, relocate)->department);
    assert(Denied([&] { services.employeeService->updateEmployee(manager, outsider.id, relocate); }));
    assert(Denied([&] { services.employeeService->updateEmployee(manager, staff.id, rename); }));
    assert(!services.employeeService->updateEmployee(admin, "missing", rename));

    assert(services.employeeService->directReports(manager, manager.id).size() == 1);
    assert(Denied([&] { services.employeeService->directReports(staff, manager.id); }));
    assert(Denied([&] { services.employeeService->getEmployee(outsider, staff.id); }));
    std::cout << "[PASS] Employee updates" << std::endl;

    // Work logs.
    NewWorkLog input;
    input.date = CalendarDate(2024, 3, 4);
    input.taskDescription = "Ship release";
    input.timeSpent = 3.5;
    WorkLog log = services.workLogService->createWorkLog(staff, input);
    assert(log.canEdit);

    auto mine = services.workLogService->listWorkLogs(staff, std::nullopt, std::nullopt, std::nullopt);
    assert(mine.size() == 1 && mine[0].canEdit);
    auto asManager = services.workLogService->listWorkLogs(manager, staff.id, CalendarDate(2024, 3, 1), CalendarDate(2024, 3, 31));
    assert(asManager.size() == 1 && !asManager[0].canEdit);
    assert(services.workLogService->listWorkLogs(staff, std::nullopt, CalendarDate(2024, 4, 1), std::nullopt).empty());
    assert(Denied([&] { services.workLogService->listWorkLogs(outsider, staff.id, std::nullopt, std::nullopt); }));

    WorkLogUpdate finish;
    finish.status = TaskStatus::Completed;
    assert(services.workLogService->updateWorkLog(staff, log.id, finish)->status == TaskStatus::Completed);
    assert(Denied([&] { services.workLogService->updateWorkLog(manager, log.id, finish); }));

    auto withNote = services.workLogService->addManagerFeedback(manager, log.id, "Nice work");
    assert(withNote && withNote->managerFeedback && *withNote->managerFeedback == "Nice work");
    assert(Denied([&] { services.workLogService->addManagerFeedback(outsider, log.id, "Hm"); }));
    std::cout << "[PASS] Work logs" << std::endl;

    // Feedback.
    NewFeedback feedback;
    feedback.workLogId = log.id;
    feedback.feedbackText = "Great job";
    feedback.rating = 5;
    auto given = services.feedbackService->giveFeedback(manager, feedback);
    assert(given && given->employeeId == staff.id && given->managerId == manager.id);
    assert(Denied([&] { services.feedbackService->giveFeedback(staff, feedback); }));

    NewFeedback badRating = feedback;
    badRating.rating = 6;
    bool invalid = false;
    try {
        services.feedbackService->giveFeedback(manager, badRating);
    } catch (const ValidationError&) {
        invalid = true;
    }
    assert(invalid);

    NewFeedback orphan = feedback;
    orphan.workLogId = "missing";
    assert(!services.feedbackService->giveFeedback(manager, orphan));

    assert(services.feedbackService->feedbackForEmployee(staff, staff.id).size() == 1);
    assert(services.feedbackService->feedbackForWorkLog(manager, log.id)->size() == 1);
    assert(!services.feedbackService->feedbackForWorkLog(manager, "missing"));
    assert(services.feedbackService->givenBy(manager).size() == 1);
    assert(Denied([&] { services.feedbackService->feedbackForEmployee(outsider, staff.id); }));
    std::cout << "[PASS] Feedback" << std::endl;

    // Leave flow.
    NewLeaveRequest leave;
    leave.startDate = CalendarDate(2024, 3, 1);
    leave.endDate = CalendarDate(2024, 3, 3);
    leave.leaveType = "Vacation";
    leave.reason = "Trip";
    LeaveRequest request = services.leaveService->fileRequest(staff, leave);
    LeaveRequest toCancel = services.leaveService->fileRequest(staff, leave);

    auto queue = services.leaveService->pendingApprovals(manager);
    assert(queue.size() == 2 && queue[0].id == request.id);
    assert(services.leaveService->pendingApprovals(admin).size() == 2);
    assert(Denied([&] { services.leaveService->pendingApprovals(staff); }));
    assert(Denied([&] { services.leaveService->getRequest(outsider, request.id); }));

    assert(Denied([&] { services.leaveService->decide(outsider, request.id, LeaveStatus::Approved, std::nullopt); }));
    auto approved = services.leaveService->decide(manager, request.id, LeaveStatus::Approved, std::string("OK"));
    assert(approved && approved->status == LeaveStatus::Approved);
    bool invalidState = false;
    try {
        services.leaveService->decide(manager, request.id, LeaveStatus::Approved, std::string("again"));
    } catch (const InvalidStateError&) {
        invalidState = true;
    }
    assert(invalidState);

    assert(Denied([&] { services.leaveService->cancel(manager, toCancel.id); }));
    auto cancelled = services.leaveService->cancel(staff, toCancel.id);
    assert(cancelled && cancelled->status == LeaveStatus::Rejected);
    assert(*cancelled->managerComments == "Cancelled by employee");
    assert(*cancelled->approvedBy == staff.id);

    assert(services.leaveService->listOwn(staff).size() == 2);
    assert(services.leaveService->listOwn(staff, LeaveStatus::Approved).size() == 1);
    assert(services.leaveService->pendingApprovals(manager).empty());
    std::cout << "[PASS] Leave flow" << std::endl;

    // Admin surface.
    assert(Denied([&] { services.adminService->settings(manager); }));
    SettingsUpdate settingsUpdate;
    settingsUpdate.logEditTimeLimitHours = 0;
    assert(services.adminService->updateSettings(admin, settingsUpdate).logEditTimeLimitHours == 0);
    assert(services.adminService->settings(admin).logEditTimeLimitHours == 0);
    // Edits by the owner are now closed.
    assert(!services.workLogService->getWorkLog(staff, log.id)->canEdit);
    assert(Denied([&] { services.workLogService->updateWorkLog(staff, log.id, finish); }));

    assert(services.employeeService->deactivateEmployee(admin, outsider.id));
    assert(!services.employeeService->authenticate("x@example.com", "pw-x@example.com"));
    assert(services.employeeService->listEmployees(admin).size() == 4);
    assert(services.employeeService->listEmployees(admin, false).size() == 5);

    services.auditRecorder->flush();
    assert(services.auditRecorder->failedCount() == 0);

    AuditQuery logins;
    logins.action = AuditAction::Login;
    auto loginEntries = services.adminService->auditTrail(admin, logins);
    assert(loginEntries.size() == 1 && loginEntries[0].resourceType == "user");

    AuditQuery logouts;
    logouts.action = AuditAction::Logout;
    auto logoutEntries = services.adminService->auditTrail(admin, logouts);
    assert(logoutEntries.size() == 1);
    assert(logoutEntries[0].userId == staff.id);
    assert(logoutEntries[0].resourceType == "user" && logoutEntries[0].resourceId == staff.id);
    assert(logoutEntries[0].details["email"] == "a@example.com");

    AuditQuery leaveAudit;
    leaveAudit.resourceType = std::string("leave_request");
    auto leaveEntries = services.adminService->auditTrail(admin, leaveAudit);
    assert(leaveEntries.size() == 4);
    assert(leaveEntries[0].action == AuditAction::Delete);
    assert(leaveEntries[0].details["action"] == "cancelled");

    AuditQuery settingsAudit;
    settingsAudit.resourceType = std::string("system_settings");
    auto settingsEntries = services.adminService->auditTrail(admin, settingsAudit);
    assert(settingsEntries.size() == 1 && settingsEntries[0].resourceId == "system_settings");
    assert(Denied([&] { services.adminService->auditTrail(manager, settingsAudit); }));
    std::cout << "[PASS] Admin surface and audit trail" << std::endl;

    services.auditRecorder->stop();
    fs::remove_all(testRoot);
    std::cout << "[Test] Services Test Passed!" << std::endl;
    return 0;
}
