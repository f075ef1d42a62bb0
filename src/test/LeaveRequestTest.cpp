#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "domain/Errors.hpp"
#include "infrastructure/Credentials.hpp"
#include "infrastructure/EmployeeRepositoryFs.hpp"
#include "infrastructure/LeaveRequestRepositoryFs.hpp"
#include "infrastructure/RecordStore.hpp"

using namespace staffledger;
using namespace staffledger::domain;
using namespace staffledger::infrastructure;
namespace fs = std::filesystem;

namespace {

Employee AddEmployee(EmployeeRepositoryFs& repo, const std::string& email, Role role,
                     std::optional<std::string> managerId = std::nullopt) {
    NewEmployee e;
    e.email = email;
    e.password = "pw";
    e.firstName = "First";
    e.lastName = "Last";
    e.role = role;
    e.managerId = std::move(managerId);
    e.hireDate = CalendarDate(2020, 1, 1);
    return repo.create(e);
}

NewLeaveRequest Vacation() {
    NewLeaveRequest input;
    input.startDate = CalendarDate(2024, 3, 1);
    input.endDate = CalendarDate(2024, 3, 3);
    input.leaveType = "Vacation";
    input.reason = "Family trip";
    return input;
}

} // namespace

int main() {
    std::cout << "[Test] Starting LeaveRequest Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / ("staffledger_leave_" + Credentials::NewId());
    auto store = std::make_shared<RecordStore>(testRoot);
    auto employees = std::make_shared<EmployeeRepositoryFs>(store);
    LeaveRequestRepositoryFs repo(store, employees);

    Employee manager = AddEmployee(*employees, "m@example.com", Role::Manager);
    Employee other = AddEmployee(*employees, "o@example.com", Role::Manager);
    Employee staff = AddEmployee(*employees, "a@example.com", Role::Employee, manager.id);

    // Filing snapshots the manager and starts pending.
    LeaveRequest request = repo.create(staff.id, Vacation());
    assert(request.status == LeaveStatus::Pending);
    assert(request.managerId && *request.managerId == manager.id);
    assert(!request.approvedBy && !request.approvedAt);
    assert(repo.findByManager(manager.id).size() == 1);
    assert(repo.findByStatus(LeaveStatus::Pending).size() == 1);
    std::cout << "[PASS] File request" << std::endl;

    // Reassigning the employee does not move the snapshot.
    EmployeeUpdate reassign;
    reassign.managerId = std::optional<std::string>(other.id);
    employees->update(staff.id, reassign);
    assert(*repo.findById(request.id)->managerId == manager.id);
    assert(repo.findByManager(other.id).empty());

    // Pending requests can be edited; dates are revalidated.
    LeaveRequestUpdate edit;
    edit.reason = std::string("Moved plans");
    auto edited = repo.update(request.id, edit);
    assert(edited && edited->reason == "Moved plans");

    LeaveRequestUpdate badDates;
    badDates.startDate = CalendarDate(2024, 3, 10);
    bool invalid = false;
    try {
        repo.update(request.id, badDates);
    } catch (const ValidationError&) {
        invalid = true;
    }
    assert(invalid);
    assert(repo.findById(request.id)->startDate == CalendarDate(2024, 3, 1));

    // Approval.
    LeaveDecision approve;
    approve.status = LeaveStatus::Approved;
    approve.comments = std::string("OK");
    approve.decidedBy = manager.id;
    auto approved = repo.decide(request.id, approve);
    assert(approved);
    assert(approved->status == LeaveStatus::Approved);
    assert(approved->approvedBy && *approved->approvedBy == manager.id);
    assert(approved->approvedAt);
    assert(approved->managerComments && *approved->managerComments == "OK");
    std::cout << "[PASS] Approve" << std::endl;

    // Terminal: a second decision and any edit fail without writing.
    bool invalidState = false;
    try {
        repo.decide(request.id, approve);
    } catch (const InvalidStateError&) {
        invalidState = true;
    }
    assert(invalidState);

    invalidState = false;
    try {
        repo.update(request.id, edit);
    } catch (const InvalidStateError&) {
        invalidState = true;
    }
    assert(invalidState);
    assert(repo.findById(request.id)->updatedAt == approved->updatedAt);
    std::cout << "[PASS] Approved request is terminal" << std::endl;

    // Rejection and malformed decisions.
    LeaveRequest second = repo.create(staff.id, Vacation());
    assert(*second.managerId == other.id);

    LeaveDecision stillPending;
    stillPending.status = LeaveStatus::Pending;
    stillPending.decidedBy = other.id;
    invalid = false;
    try {
        repo.decide(second.id, stillPending);
    } catch (const ValidationError&) {
        invalid = true;
    }
    assert(invalid);

    LeaveDecision reject;
    reject.status = LeaveStatus::Rejected;
    reject.decidedBy = other.id;
    auto rejected = repo.decide(second.id, reject);
    assert(rejected && rejected->status == LeaveStatus::Rejected);
    assert(!rejected->managerComments);
    assert(!repo.decide("missing", reject));

    // End before start is refused at creation.
    NewLeaveRequest backwards = Vacation();
    backwards.startDate = CalendarDate(2024, 3, 5);
    invalid = false;
    try {
        repo.create(staff.id, backwards);
    } catch (const ValidationError&) {
        invalid = true;
    }
    assert(invalid);
    assert(repo.findByEmployee(staff.id).size() == 2);

    // Single-day requests are fine.
    NewLeaveRequest oneDay = Vacation();
    oneDay.endDate = oneDay.startDate;
    repo.create(staff.id, oneDay);
    assert(repo.findByEmployee(staff.id).size() == 3);
    std::cout << "[PASS] Reject and validation" << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] LeaveRequest Test Passed!" << std::endl;
    return 0;
}
