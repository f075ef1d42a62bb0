#include <cassert>
#include <chrono>
#include <iostream>

#include "domain/value_objects/CalendarDate.hpp"
#include "domain/value_objects/Timestamp.hpp"
#include "infrastructure/Credentials.hpp"
#include "infrastructure/RecordCodec.hpp"

using namespace staffledger::domain;
using namespace staffledger::infrastructure;

int main() {
    std::cout << "[Test] Starting RecordCodec Test..." << std::endl;

    // Calendar dates.
    auto date = CalendarDate::Parse("2024-02-29");
    assert(date && date->year == 2024 && date->month == 2 && date->day == 29);
    assert(date->toString() == "2024-02-29");
    assert(!CalendarDate::Parse("2023-02-29"));
    assert(!CalendarDate::Parse("2024-13-01"));
    assert(!CalendarDate::Parse("2024-1-01"));
    assert(!CalendarDate::Parse(""));
    auto fromDateTime = CalendarDate::Parse("2024-03-01T08:30:00");
    assert(fromDateTime && *fromDateTime == CalendarDate(2024, 3, 1));
    assert(CalendarDate(2024, 3, 1) < CalendarDate(2024, 3, 2));
    assert(InDateRange(CalendarDate(2024, 3, 1), CalendarDate(2024, 3, 1), CalendarDate(2024, 3, 1)));
    assert(!InDateRange(CalendarDate(2024, 3, 2), std::nullopt, CalendarDate(2024, 3, 1)));
    assert(InDateRange(CalendarDate(1999, 1, 1), std::nullopt, std::nullopt));
    std::cout << "[PASS] CalendarDate" << std::endl;

    // Timestamps keep microseconds.
    Timestamp now = Now();
    std::string text = FormatTimestamp(now);
    assert(text.size() == 27 && text.back() == 'Z' && text[10] == 'T');
    auto parsed = ParseTimestamp(text);
    assert(parsed && *parsed == now);
    auto whole = ParseTimestamp("2024-03-01T12:00:00");
    assert(whole && FormatTimestamp(*whole) == "2024-03-01T12:00:00.000000Z");
    auto fraction = ParseTimestamp("2024-03-01T12:00:00.5Z");
    assert(fraction && *fraction - *whole == std::chrono::milliseconds(500));
    assert(!ParseTimestamp("yesterday"));
    assert(FormatTimestampCompact(*whole) == "20240301T120000.000000");
    std::cout << "[PASS] Timestamp" << std::endl;

    // Employee rows use snake_case names and null for absent values.
    Employee e;
    e.id = Credentials::NewId();
    e.email = "ada@example.com";
    e.passwordHash = Credentials::HashPassword("pw");
    e.firstName = "Ada";
    e.lastName = "Lovelace";
    e.role = Role::Manager;
    e.position = std::string("Lead");
    e.hireDate = CalendarDate(2021, 6, 1);
    e.createdAt = now;
    e.updatedAt = now;
    Record row = EncodeEmployee(e);
    assert(row["role"] == "manager");
    assert(row["manager_id"].is_null());
    assert(row["hire_date"] == "2021-06-01");
    assert(row["is_active"] == true);
    Employee back = DecodeEmployee(row);
    assert(back.email == e.email && back.role == Role::Manager);
    assert(back.position && *back.position == "Lead");
    assert(!back.department);
    assert(back.createdAt == now);

    // Unknown enum values and wrong types are rejected.
    Record badRole = row;
    badRole["role"] = "owner";
    bool rejected = false;
    try {
        DecodeEmployee(badRole);
    } catch (const RecordDecodeError&) {
        rejected = true;
    }
    assert(rejected);

    Record missing = row;
    missing.erase("email");
    rejected = false;
    try {
        DecodeEmployee(missing);
    } catch (const RecordDecodeError&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[PASS] Employee codec" << std::endl;

    // Work logs never persist can_edit.
    WorkLog log;
    log.id = "wl";
    log.employeeId = e.id;
    log.date = CalendarDate(2024, 3, 1);
    log.taskDescription = "Review";
    log.timeSpent = 1.25;
    log.status = TaskStatus::Blocked;
    log.attachments.push_back({"spec.pdf", "https://files.example.com/spec.pdf", now});
    log.canEdit = true;
    log.createdAt = now;
    log.updatedAt = now;
    Record logRow = EncodeWorkLog(log);
    assert(logRow.find("can_edit") == logRow.end());
    assert(logRow["status"] == "blocked");
    WorkLog logBack = DecodeWorkLog(logRow);
    assert(!logBack.canEdit);
    assert(logBack.timeSpent == 1.25);
    assert(logBack.attachments.size() == 1 && logBack.attachments[0].filename == "spec.pdf");

    // Whole-number hours written by other tools decode as well.
    logRow["time_spent"] = 3;
    assert(DecodeWorkLog(logRow).timeSpent == 3.0);
    std::cout << "[PASS] WorkLog codec" << std::endl;

    // Leave requests and audit entries.
    LeaveRequest leave;
    leave.id = "lr";
    leave.employeeId = e.id;
    leave.startDate = CalendarDate(2024, 3, 1);
    leave.endDate = CalendarDate(2024, 3, 3);
    leave.leaveType = "Vacation";
    leave.status = LeaveStatus::Approved;
    leave.approvedAt = now;
    leave.createdAt = now;
    leave.updatedAt = now;
    LeaveRequest leaveBack = DecodeLeaveRequest(EncodeLeaveRequest(leave));
    assert(leaveBack.status == LeaveStatus::Approved);
    assert(leaveBack.approvedAt && *leaveBack.approvedAt == now);
    assert(!leaveBack.approvedBy);

    AuditTrail entry;
    entry.id = "a";
    entry.userId = e.id;
    entry.action = AuditAction::Login;
    entry.resourceType = "employee";
    entry.resourceId = e.id;
    entry.details = {{"nested", {{"k", 1}}}};
    entry.timestamp = now;
    Record auditRow = EncodeAuditTrail(entry);
    assert(auditRow["action"] == "login");
    AuditTrail entryBack = DecodeAuditTrail(auditRow);
    assert(entryBack.details["nested"]["k"] == 1);
    assert(!entryBack.ipAddress);
    std::cout << "[PASS] LeaveRequest and AuditTrail codec" << std::endl;

    std::cout << "[Test] RecordCodec Test Passed!" << std::endl;
    return 0;
}
