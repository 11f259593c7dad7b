// CONCORD - Operation Status Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/core/status.h>

namespace concord {

const char* Status::CodeName(Code code) {
    switch (code) {
        case OK: return "OK";
        case INVALID_ARGUMENT: return "InvalidArgument";
        case NOT_FOUND: return "NotFound";
        case DUPLICATE_ID: return "DuplicateId";
        case STATE_CONFLICT: return "StateConflict";
        case TRANSPORT_ERROR: return "TransportError";
        case GOVERNANCE_DISABLED: return "GovernanceDisabled";
        case STORAGE_ERROR: return "StorageError";
        case CORRUPTION: return "Corruption";
        default: return "Unknown";
    }
}

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result = CodeName(code_);
    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }
    return result;
}

} // namespace concord
