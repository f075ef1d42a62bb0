/**
 * @file RecordCodec.hpp
 * @brief Mapping between domain entities and stored flat JSON records.
 *
 * One Encode/Decode pair per entity; field names are the snake_case names of
 * the persisted layout. Optional fields are written as null when empty.
 */

#pragma once

#include <stdexcept>
#include <string>

#include "domain/AuditTrail.hpp"
#include "domain/Employee.hpp"
#include "domain/Feedback.hpp"
#include "domain/LeaveRequest.hpp"
#include "domain/SystemSettings.hpp"
#include "domain/WorkLog.hpp"
#include "infrastructure/RecordStore.hpp"

namespace staffledger::infrastructure {

/// Raised when a stored record is missing a field or holds a bad value.
class RecordDecodeError : public std::runtime_error {
public:
    explicit RecordDecodeError(const std::string& message) : std::runtime_error(message) {}
};

namespace collections {
inline constexpr const char* kEmployees = "employees";
inline constexpr const char* kWorkLogs = "work_logs";
inline constexpr const char* kLeaveRequests = "leave_requests";
inline constexpr const char* kFeedback = "feedback";
inline constexpr const char* kAuditTrails = "audit_trails";
inline constexpr const char* kSettings = "settings";
} // namespace collections

Record EncodeEmployee(const domain::Employee& employee);
domain::Employee DecodeEmployee(const Record& record);

Record EncodeWorkLog(const domain::WorkLog& log);
domain::WorkLog DecodeWorkLog(const Record& record);

Record EncodeLeaveRequest(const domain::LeaveRequest& request);
domain::LeaveRequest DecodeLeaveRequest(const Record& record);

Record EncodeFeedback(const domain::Feedback& feedback);
domain::Feedback DecodeFeedback(const Record& record);

Record EncodeAuditTrail(const domain::AuditTrail& entry);
domain::AuditTrail DecodeAuditTrail(const Record& record);

Record EncodeSettings(const domain::SystemSettings& settings);
domain::SystemSettings DecodeSettings(const Record& record);

/**
 * @brief Binds an entity type to its collection name and codec, for
 * TypedCollection.
 */
template <typename Entity>
struct RecordTraits;

template <>
struct RecordTraits<domain::Employee> {
    static constexpr const char* kCollection = collections::kEmployees;
    static Record Encode(const domain::Employee& e) { return EncodeEmployee(e); }
    static domain::Employee Decode(const Record& r) { return DecodeEmployee(r); }
};

template <>
struct RecordTraits<domain::WorkLog> {
    static constexpr const char* kCollection = collections::kWorkLogs;
    static Record Encode(const domain::WorkLog& e) { return EncodeWorkLog(e); }
    static domain::WorkLog Decode(const Record& r) { return DecodeWorkLog(r); }
};

template <>
struct RecordTraits<domain::LeaveRequest> {
    static constexpr const char* kCollection = collections::kLeaveRequests;
    static Record Encode(const domain::LeaveRequest& e) { return EncodeLeaveRequest(e); }
    static domain::LeaveRequest Decode(const Record& r) { return DecodeLeaveRequest(r); }
};

template <>
struct RecordTraits<domain::Feedback> {
    static constexpr const char* kCollection = collections::kFeedback;
    static Record Encode(const domain::Feedback& e) { return EncodeFeedback(e); }
    static domain::Feedback Decode(const Record& r) { return DecodeFeedback(r); }
};

template <>
struct RecordTraits<domain::AuditTrail> {
    static constexpr const char* kCollection = collections::kAuditTrails;
    static Record Encode(const domain::AuditTrail& e) { return EncodeAuditTrail(e); }
    static domain::AuditTrail Decode(const Record& r) { return DecodeAuditTrail(r); }
};

template <>
struct RecordTraits<domain::SystemSettings> {
    static constexpr const char* kCollection = collections::kSettings;
    static Record Encode(const domain::SystemSettings& e) { return EncodeSettings(e); }
    static domain::SystemSettings Decode(const Record& r) { return DecodeSettings(r); }
};

} // namespace staffledger::infrastructure
