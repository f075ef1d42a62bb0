/**
 * @file LeaveRequestRepositoryFs.cpp
 * @brief Implementation of LeaveRequestRepositoryFs.
 */

#include "infrastructure/LeaveRequestRepositoryFs.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Credentials.hpp"

namespace staffledger::infrastructure {

using namespace staffledger::domain;

namespace {

void RequirePending(const LeaveRequest& request) {
    if (request.status != LeaveStatus::Pending) {
        throw InvalidStateError("Leave request " + request.id + " has already been processed (" +
                                LeaveStatusToString(request.status) + ")");
    }
}

void RequireOrderedDates(const CalendarDate& start, const CalendarDate& end) {
    if (start > end) {
        throw ValidationError("Start date must be before or equal to end date");
    }
}

} // namespace

LeaveRequestRepositoryFs::LeaveRequestRepositoryFs(std::shared_ptr<RecordStore> store,
                                                   std::shared_ptr<IEmployeeRepository> employees)
    : m_requests(std::move(store)), m_employees(std::move(employees)) {}

LeaveRequest LeaveRequestRepositoryFs::create(const std::string& employeeId, const NewLeaveRequest& input) {
    RequireOrderedDates(input.startDate, input.endDate);

    // Snapshot, never re-resolved: a later reassignment does not move approval rights.
    std::optional<std::string> managerId;
    if (auto employee = m_employees->findById(employeeId)) {
        managerId = employee->managerId;
    }

    return m_requests.insert([&](const std::vector<LeaveRequest>&) {
        LeaveRequest request;
        request.id = Credentials::NewId();
        request.employeeId = employeeId;
        request.startDate = input.startDate;
        request.endDate = input.endDate;
        request.leaveType = input.leaveType;
        request.reason = input.reason;
        request.status = LeaveStatus::Pending;
        request.managerId = managerId;
        request.createdAt = Now();
        request.updatedAt = request.createdAt;
        return request;
    });
}

std::optional<LeaveRequest> LeaveRequestRepositoryFs::findById(const std::string& id) {
    return m_requests.findById(id);
}

std::vector<LeaveRequest> LeaveRequestRepositoryFs::findByEmployee(const std::string& employeeId) {
    return m_requests.filter([&](const LeaveRequest& r) { return r.employeeId == employeeId; });
}

std::vector<LeaveRequest> LeaveRequestRepositoryFs::findByManager(const std::string& managerId) {
    return m_requests.filter([&](const LeaveRequest& r) { return r.managerId == managerId; });
}

std::vector<LeaveRequest> LeaveRequestRepositoryFs::findByStatus(LeaveStatus status) {
    return m_requests.filter([&](const LeaveRequest& r) { return r.status == status; });
}

std::optional<LeaveRequest> LeaveRequestRepositoryFs::update(const std::string& id, const LeaveRequestUpdate& update) {
    return m_requests.modify(id, [&](LeaveRequest& request) {
        RequirePending(request);
        CalendarDate start = update.startDate.value_or(request.startDate);
        CalendarDate end = update.endDate.value_or(request.endDate);
        RequireOrderedDates(start, end);

        request.startDate = start;
        request.endDate = end;
        ApplyPatch(request.leaveType, update.leaveType);
        ApplyPatch(request.reason, update.reason);
    });
}

std::optional<LeaveRequest> LeaveRequestRepositoryFs::decide(const std::string& id, const LeaveDecision& decision) {
    if (decision.status == LeaveStatus::Pending) {
        throw ValidationError("A decision must approve or reject");
    }

    return m_requests.modify(id, [&](LeaveRequest& request) {
        RequirePending(request);
        request.status = decision.status;
        request.managerComments = decision.comments;
        request.approvedBy = decision.decidedBy;
        request.approvedAt = Now();
    });
}

} // namespace staffledger::infrastructure
