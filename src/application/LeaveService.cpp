/**
 * @file LeaveService.cpp
 * @brief Implementation of LeaveService.
 */

#include "application/LeaveService.hpp"
#include "domain/Errors.hpp"

#include <algorithm>

namespace staffledger::application {

using namespace staffledger::domain;
using json = nlohmann::json;

namespace {

constexpr const char* kCancelledComment = "Cancelled by employee";

void SortByCreated(std::vector<LeaveRequest>& requests, bool newestFirst) {
    std::stable_sort(requests.begin(), requests.end(), [newestFirst](const LeaveRequest& a, const LeaveRequest& b) {
        return newestFirst ? a.createdAt > b.createdAt : a.createdAt < b.createdAt;
    });
}

void RequireOwnPending(const Employee& actor, const LeaveRequest& request, const std::string& verb) {
    if (request.employeeId != actor.id) {
        throw PermissionDeniedError("Can only " + verb + " your own leave requests");
    }
    if (request.status != LeaveStatus::Pending) {
        throw InvalidStateError("Cannot " + verb + " leave request that has already been processed");
    }
}

} // namespace

LeaveService::LeaveService(std::shared_ptr<ILeaveRequestRepository> requests,
                           std::shared_ptr<AuthorizationPolicy> policy,
                           std::shared_ptr<AuditRecorder> audit)
    : m_requests(std::move(requests)), m_policy(std::move(policy)), m_audit(std::move(audit)) {}

LeaveRequest LeaveService::fileRequest(const Employee& actor, const NewLeaveRequest& input) {
    LeaveRequest request = m_requests->create(actor.id, input);
    m_audit->record(actor.id, AuditAction::Create, "leave_request", request.id,
                    {{"start_date", request.startDate.toString()},
                     {"end_date", request.endDate.toString()},
                     {"leave_type", request.leaveType}});
    return request;
}

std::vector<LeaveRequest> LeaveService::listOwn(const Employee& actor, const std::optional<LeaveStatus>& status) {
    auto requests = m_requests->findByEmployee(actor.id);
    if (status) {
        requests.erase(std::remove_if(requests.begin(), requests.end(),
                                      [&](const LeaveRequest& r) { return r.status != *status; }),
                       requests.end());
    }
    SortByCreated(requests, true);
    return requests;
}

std::vector<LeaveRequest> LeaveService::pendingApprovals(const Employee& actor) {
    if (!AuthorizationPolicy::IsManagerOrAdmin(actor)) {
        throw PermissionDeniedError("Only managers and admins can view pending approvals");
    }

    std::vector<LeaveRequest> pending;
    if (actor.role == Role::Admin) {
        pending = m_requests->findByStatus(LeaveStatus::Pending);
    } else {
        pending = m_requests->findByManager(actor.id);
        pending.erase(std::remove_if(pending.begin(), pending.end(),
                                     [](const LeaveRequest& r) { return r.status != LeaveStatus::Pending; }),
                      pending.end());
    }
    SortByCreated(pending, false);
    return pending;
}

std::optional<LeaveRequest> LeaveService::getRequest(const Employee& actor, const std::string& id) {
    auto request = m_requests->findById(id);
    if (!request) return std::nullopt;
    if (!m_policy->canViewLeaveRequest(actor, *request)) {
        throw PermissionDeniedError("Not authorized to access this leave request");
    }
    return request;
}

std::optional<LeaveRequest> LeaveService::updateRequest(const Employee& actor,
                                                        const std::string& id,
                                                        const LeaveRequestUpdate& update) {
    auto request = m_requests->findById(id);
    if (!request) return std::nullopt;
    RequireOwnPending(actor, *request, "update");

    auto updated = m_requests->update(id, update);
    if (!updated) return std::nullopt;

    json details = json::object();
    if (update.startDate) details["start_date"] = update.startDate->toString();
    if (update.endDate) details["end_date"] = update.endDate->toString();
    if (update.leaveType) details["leave_type"] = *update.leaveType;
    if (update.reason) details["reason"] = *update.reason;
    m_audit->record(actor.id, AuditAction::Update, "leave_request", id, details);
    return updated;
}

std::optional<LeaveRequest> LeaveService::decide(const Employee& actor,
                                                 const std::string& id,
                                                 LeaveStatus status,
                                                 const std::optional<std::string>& comments) {
    auto request = m_requests->findById(id);
    if (!request) return std::nullopt;
    if (!m_policy->canApproveLeave(actor, *request)) {
        throw PermissionDeniedError("Not authorized to approve this leave request");
    }

    LeaveDecision decision;
    decision.status = status;
    decision.comments = comments;
    decision.decidedBy = actor.id;

    auto decided = m_requests->decide(id, decision);
    if (!decided) return std::nullopt;

    m_audit->record(actor.id, status == LeaveStatus::Approved ? AuditAction::Approve : AuditAction::Reject,
                    "leave_request", id,
                    {{"status", LeaveStatusToString(status)},
                     {"comments", comments ? json(*comments) : json(nullptr)}});
    return decided;
}

std::optional<LeaveRequest> LeaveService::cancel(const Employee& actor, const std::string& id) {
    auto request = m_requests->findById(id);
    if (!request) return std::nullopt;
    RequireOwnPending(actor, *request, "cancel");

    LeaveDecision decision;
    decision.status = LeaveStatus::Rejected;
    decision.comments = std::string(kCancelledComment);
    decision.decidedBy = actor.id;

    auto cancelled = m_requests->decide(id, decision);
    if (!cancelled) return std::nullopt;

    m_audit->record(actor.id, AuditAction::Delete, "leave_request", id, {{"action", "cancelled"}});
    return cancelled;
}

} // namespace staffledger::application
