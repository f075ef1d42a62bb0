/**
 * @file Errors.hpp
 * @brief Failure conditions raised by repositories and application services.
 *
 * Absence is never an error: lookups return std::nullopt. Everything below is
 * raised before a write begins, except StorageWriteError which reports that a
 * write was attempted and the previous committed state was kept.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace staffledger::domain {

class StaffLedgerError : public std::runtime_error {
public:
    explicit StaffLedgerError(const std::string& message) : std::runtime_error(message) {}
};

/// A uniqueness constraint would be violated (e.g. duplicate employee email).
class ConflictError : public StaffLedgerError {
public:
    using StaffLedgerError::StaffLedgerError;
};

/// A structural invariant of the input is violated (e.g. start_date > end_date).
class ValidationError : public StaffLedgerError {
public:
    using StaffLedgerError::StaffLedgerError;
};

/// A state machine transition is not allowed (e.g. approving a decided request).
class InvalidStateError : public StaffLedgerError {
public:
    using StaffLedgerError::StaffLedgerError;
};

/// Serialization or atomic replace failed; the live collection is unchanged.
class StorageWriteError : public StaffLedgerError {
public:
    using StaffLedgerError::StaffLedgerError;
};

/// The acting employee is not allowed to perform the operation.
class PermissionDeniedError : public StaffLedgerError {
public:
    using StaffLedgerError::StaffLedgerError;
};

} // namespace staffledger::domain
