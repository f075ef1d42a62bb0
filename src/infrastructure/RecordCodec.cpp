/**
 * @file RecordCodec.cpp
 * @brief Implementation of the entity <-> record mapping.
 */

#include "infrastructure/RecordCodec.hpp"

namespace staffledger::infrastructure {

using namespace staffledger::domain;
using json = nlohmann::json;

namespace {

const json& Require(const Record& record, const char* field) {
    auto it = record.find(field);
    if (it == record.end()) {
        throw RecordDecodeError(std::string("missing field '") + field + "'");
    }
    return *it;
}

std::string GetString(const Record& record, const char* field) {
    const json& value = Require(record, field);
    if (!value.is_string()) {
        throw RecordDecodeError(std::string("field '") + field + "' is not a string");
    }
    return value.get<std::string>();
}

std::optional<std::string> GetOptionalString(const Record& record, const char* field) {
    auto it = record.find(field);
    if (it == record.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw RecordDecodeError(std::string("field '") + field + "' is not a string");
    }
    return it->get<std::string>();
}

json OptionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

CalendarDate GetDate(const Record& record, const char* field) {
    auto parsed = CalendarDate::Parse(GetString(record, field));
    if (!parsed) {
        throw RecordDecodeError(std::string("field '") + field + "' is not a date");
    }
    return *parsed;
}

Timestamp GetTimestamp(const Record& record, const char* field) {
    auto parsed = ParseTimestamp(GetString(record, field));
    if (!parsed) {
        throw RecordDecodeError(std::string("field '") + field + "' is not a timestamp");
    }
    return *parsed;
}

std::optional<Timestamp> GetOptionalTimestamp(const Record& record, const char* field) {
    auto text = GetOptionalString(record, field);
    if (!text) return std::nullopt;
    auto parsed = ParseTimestamp(*text);
    if (!parsed) {
        throw RecordDecodeError(std::string("field '") + field + "' is not a timestamp");
    }
    return parsed;
}

std::vector<std::string> GetStringList(const Record& record, const char* field) {
    const json& value = Require(record, field);
    if (!value.is_array()) {
        throw RecordDecodeError(std::string("field '") + field + "' is not an array");
    }
    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw RecordDecodeError(std::string("field '") + field + "' holds a non-string");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

json GetObjectOrEmpty(const Record& record, const char* field) {
    auto it = record.find(field);
    if (it == record.end() || it->is_null()) return json::object();
    if (!it->is_object()) {
        throw RecordDecodeError(std::string("field '") + field + "' is not an object");
    }
    return *it;
}

template <typename Enum>
Enum GetEnum(const Record& record, const char* field, std::optional<Enum> (*fromString)(const std::string&)) {
    auto parsed = fromString(GetString(record, field));
    if (!parsed) {
        throw RecordDecodeError(std::string("field '") + field + "' has an unknown value");
    }
    return *parsed;
}

} // namespace

// --- Employee ---

Record EncodeEmployee(const Employee& e) {
    return json{
        {"id", e.id},
        {"email", e.email},
        {"password_hash", e.passwordHash},
        {"first_name", e.firstName},
        {"last_name", e.lastName},
        {"role", RoleToString(e.role)},
        {"manager_id", OptionalToJson(e.managerId)},
        {"department", OptionalToJson(e.department)},
        {"position", OptionalToJson(e.position)},
        {"hire_date", e.hireDate.toString()},
        {"is_active", e.isActive},
        {"created_at", FormatTimestamp(e.createdAt)},
        {"updated_at", FormatTimestamp(e.updatedAt)}
    };
}

Employee DecodeEmployee(const Record& r) {
    Employee e;
    e.id = GetString(r, "id");
    e.email = GetString(r, "email");
    e.passwordHash = GetString(r, "password_hash");
    e.firstName = GetString(r, "first_name");
    e.lastName = GetString(r, "last_name");
    e.role = GetEnum<Role>(r, "role", &RoleFromString);
    e.managerId = GetOptionalString(r, "manager_id");
    e.department = GetOptionalString(r, "department");
    e.position = GetOptionalString(r, "position");
    e.hireDate = GetDate(r, "hire_date");
    auto active = r.find("is_active");
    if (active != r.end() && !active->is_boolean()) {
        throw RecordDecodeError("field 'is_active' is not a boolean");
    }
    e.isActive = active == r.end() ? true : active->get<bool>();
    e.createdAt = GetTimestamp(r, "created_at");
    e.updatedAt = GetTimestamp(r, "updated_at");
    return e;
}

// --- WorkLog ---

Record EncodeWorkLog(const WorkLog& log) {
    json attachments = json::array();
    for (const auto& a : log.attachments) {
        attachments.push_back({
            {"filename", a.filename},
            {"url", a.url},
            {"uploaded_at", FormatTimestamp(a.uploadedAt)}
        });
    }

    return json{
        {"id", log.id},
        {"employee_id", log.employeeId},
        {"date", log.date.toString()},
        {"task_description", log.taskDescription},
        {"time_spent", log.timeSpent},
        {"status", TaskStatusToString(log.status)},
        {"project", OptionalToJson(log.project)},
        {"category", OptionalToJson(log.category)},
        {"attachments", attachments},
        {"notes", OptionalToJson(log.notes)},
        {"manager_feedback", OptionalToJson(log.managerFeedback)},
        {"created_at", FormatTimestamp(log.createdAt)},
        {"updated_at", FormatTimestamp(log.updatedAt)}
    };
}

WorkLog DecodeWorkLog(const Record& r) {
    WorkLog log;
    log.id = GetString(r, "id");
    log.employeeId = GetString(r, "employee_id");
    log.date = GetDate(r, "date");
    log.taskDescription = GetString(r, "task_description");

    const json& hours = Require(r, "time_spent");
    if (!hours.is_number()) {
        throw RecordDecodeError("field 'time_spent' is not a number");
    }
    log.timeSpent = hours.get<double>();

    log.status = GetEnum<TaskStatus>(r, "status", &TaskStatusFromString);
    log.project = GetOptionalString(r, "project");
    log.category = GetOptionalString(r, "category");
    log.notes = GetOptionalString(r, "notes");
    log.managerFeedback = GetOptionalString(r, "manager_feedback");

    auto it = r.find("attachments");
    if (it != r.end() && it->is_array()) {
        for (const auto& a : *it) {
            WorkLogAttachment attachment;
            attachment.filename = GetString(a, "filename");
            attachment.url = GetString(a, "url");
            attachment.uploadedAt = GetTimestamp(a, "uploaded_at");
            log.attachments.push_back(std::move(attachment));
        }
    }

    log.createdAt = GetTimestamp(r, "created_at");
    log.updatedAt = GetTimestamp(r, "updated_at");
    return log;
}

// --- LeaveRequest ---

Record EncodeLeaveRequest(const LeaveRequest& req) {
    return json{
        {"id", req.id},
        {"employee_id", req.employeeId},
        {"start_date", req.startDate.toString()},
        {"end_date", req.endDate.toString()},
        {"leave_type", req.leaveType},
        {"reason", req.reason},
        {"status", LeaveStatusToString(req.status)},
        {"manager_id", OptionalToJson(req.managerId)},
        {"manager_comments", OptionalToJson(req.managerComments)},
        {"approved_by", OptionalToJson(req.approvedBy)},
        {"approved_at", req.approvedAt ? json(FormatTimestamp(*req.approvedAt)) : json(nullptr)},
        {"created_at", FormatTimestamp(req.createdAt)},
        {"updated_at", FormatTimestamp(req.updatedAt)}
    };
}

LeaveRequest DecodeLeaveRequest(const Record& r) {
    LeaveRequest req;
    req.id = GetString(r, "id");
    req.employeeId = GetString(r, "employee_id");
    req.startDate = GetDate(r, "start_date");
    req.endDate = GetDate(r, "end_date");
    req.leaveType = GetString(r, "leave_type");
    req.reason = GetString(r, "reason");
    req.status = GetEnum<LeaveStatus>(r, "status", &LeaveStatusFromString);
    req.managerId = GetOptionalString(r, "manager_id");
    req.managerComments = GetOptionalString(r, "manager_comments");
    req.approvedBy = GetOptionalString(r, "approved_by");
    req.approvedAt = GetOptionalTimestamp(r, "approved_at");
    req.createdAt = GetTimestamp(r, "created_at");
    req.updatedAt = GetTimestamp(r, "updated_at");
    return req;
}

// --- Feedback ---

Record EncodeFeedback(const Feedback& fb) {
    return json{
        {"id", fb.id},
        {"work_log_id", fb.workLogId},
        {"employee_id", fb.employeeId},
        {"manager_id", fb.managerId},
        {"feedback_text", fb.feedbackText},
        {"rating", fb.rating ? json(*fb.rating) : json(nullptr)},
        {"created_at", FormatTimestamp(fb.createdAt)},
        {"updated_at", FormatTimestamp(fb.updatedAt)}
    };
}

Feedback DecodeFeedback(const Record& r) {
    Feedback fb;
    fb.id = GetString(r, "id");
    fb.workLogId = GetString(r, "work_log_id");
    fb.employeeId = GetString(r, "employee_id");
    fb.managerId = GetString(r, "manager_id");
    fb.feedbackText = GetString(r, "feedback_text");

    auto it = r.find("rating");
    if (it != r.end() && !it->is_null()) {
        if (!it->is_number_integer()) {
            throw RecordDecodeError("field 'rating' is not an integer");
        }
        fb.rating = it->get<int>();
    }

    fb.createdAt = GetTimestamp(r, "created_at");
    fb.updatedAt = GetTimestamp(r, "updated_at");
    return fb;
}

// --- AuditTrail ---

Record EncodeAuditTrail(const AuditTrail& entry) {
    return json{
        {"id", entry.id},
        {"user_id", entry.userId},
        {"action", AuditActionToString(entry.action)},
        {"resource_type", entry.resourceType},
        {"resource_id", entry.resourceId},
        {"details", entry.details},
        {"ip_address", OptionalToJson(entry.ipAddress)},
        {"user_agent", OptionalToJson(entry.userAgent)},
        {"timestamp", FormatTimestamp(entry.timestamp)}
    };
}

AuditTrail DecodeAuditTrail(const Record& r) {
    AuditTrail entry;
    entry.id = GetString(r, "id");
    entry.userId = GetString(r, "user_id");
    entry.action = GetEnum<AuditAction>(r, "action", &AuditActionFromString);
    entry.resourceType = GetString(r, "resource_type");
    entry.resourceId = GetString(r, "resource_id");
    entry.details = GetObjectOrEmpty(r, "details");
    entry.ipAddress = GetOptionalString(r, "ip_address");
    entry.userAgent = GetOptionalString(r, "user_agent");
    entry.timestamp = GetTimestamp(r, "timestamp");
    return entry;
}

// --- SystemSettings ---

Record EncodeSettings(const SystemSettings& s) {
    return json{
        {"id", s.id},
        {"log_edit_time_limit_hours", s.logEditTimeLimitHours},
        {"default_leave_types", s.defaultLeaveTypes},
        {"default_task_categories", s.defaultTaskCategories},
        {"notification_settings", s.notificationSettings},
        {"created_at", FormatTimestamp(s.createdAt)},
        {"updated_at", FormatTimestamp(s.updatedAt)}
    };
}

SystemSettings DecodeSettings(const Record& r) {
    SystemSettings s;
    s.id = r.value("id", std::string(SystemSettings::kId));

    const json& limit = Require(r, "log_edit_time_limit_hours");
    if (!limit.is_number_integer()) {
        throw RecordDecodeError("field 'log_edit_time_limit_hours' is not an integer");
    }
    s.logEditTimeLimitHours = limit.get<int>();

    s.defaultLeaveTypes = GetStringList(r, "default_leave_types");
    s.defaultTaskCategories = GetStringList(r, "default_task_categories");
    s.notificationSettings = GetObjectOrEmpty(r, "notification_settings");
    s.createdAt = GetTimestamp(r, "created_at");
    s.updatedAt = GetTimestamp(r, "updated_at");
    return s;
}

} // namespace staffledger::infrastructure
