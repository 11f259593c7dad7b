// CONCORD - Database Abstraction Layer Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/db/database.h>

namespace concord {
namespace db {

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND: result = "NotFound: "; break;
        case CORRUPTION: result = "Corruption: "; break;
        case NOT_SUPPORTED: result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR: result = "IOError: "; break;
        default: result = "Unknown: "; break;
    }
    return result + message_;
}

} // namespace db
} // namespace concord
