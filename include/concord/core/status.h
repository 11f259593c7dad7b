// CONCORD - Operation Status
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Result type shared by the governance store, the knowledge service and the
// cascade engine. Codes map one-to-one onto the error taxonomy surfaced to
// callers and to the CLI exit path.

#ifndef CONCORD_CORE_STATUS_H
#define CONCORD_CORE_STATUS_H

#include <string>

namespace concord {

// ============================================================================
// Status
// ============================================================================

/**
 * Status returned by every mutating governance operation.
 *
 * ConflictFact / StaleFact are not represented here: they are outcomes of a
 * fact write (see knowledge::FactApplyStatus), not failures.
 */
class Status {
public:
    enum Code {
        OK = 0,
        INVALID_ARGUMENT = 1,     // malformed envelope or missing field
        NOT_FOUND = 2,
        DUPLICATE_ID = 3,
        STATE_CONFLICT = 4,       // CAS mismatch or terminal status already set
        TRANSPORT_ERROR = 5,
        GOVERNANCE_DISABLED = 6,
        STORAGE_ERROR = 7,
        CORRUPTION = 8,
    };

private:
    Code code_;
    std::string message_;

public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status DuplicateId(const std::string& msg = "") { return Status(DUPLICATE_ID, msg); }
    static Status StateConflict(const std::string& msg = "") { return Status(STATE_CONFLICT, msg); }
    static Status TransportError(const std::string& msg = "") { return Status(TRANSPORT_ERROR, msg); }
    static Status GovernanceDisabled(const std::string& msg = "") { return Status(GOVERNANCE_DISABLED, msg); }
    static Status StorageError(const std::string& msg = "") { return Status(STORAGE_ERROR, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }

    bool ok() const { return code_ == OK; }
    bool IsInvalidArgument() const { return code_ == INVALID_ARGUMENT; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsDuplicateId() const { return code_ == DUPLICATE_ID; }
    bool IsStateConflict() const { return code_ == STATE_CONFLICT; }
    bool IsTransportError() const { return code_ == TRANSPORT_ERROR; }
    bool IsGovernanceDisabled() const { return code_ == GOVERNANCE_DISABLED; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// Short name of the code ("NotFound", "StateConflict", ...)
    static const char* CodeName(Code code);

    std::string ToString() const;
};

} // namespace concord

#endif // CONCORD_CORE_STATUS_H
