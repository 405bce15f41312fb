#include "errors.hpp"
#include <sstream>

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Authentication: return "authentication";
        case ErrorKind::CredentialRejected: return "credential rejected";
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Permanent: return "permanent";
        case ErrorKind::Pagination: return "pagination";
        case ErrorKind::InvalidReference: return "invalid reference";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

void throwForStatus(long status, const std::string& context) {
    if (status >= 200 && status < 300) {
        return;
    }

    std::stringstream ss;
    ss << context << ": HTTP " << status;

    if (status == 404 || status == 410) {
        throw PermanentItemError(ss.str() + " (not found)");
    }
    else if (status == 403) {
        throw PermanentItemError(ss.str() + " (forbidden)");
    }
    else if (status == 408 || status == 429 || status >= 500) {
        throw TransientFetchError(ss.str());
    }
    else if (status >= 400) {
        throw PermanentItemError(ss.str());
    }

    // 0 (no response), 1xx and unfollowed 3xx
    throw TransientFetchError(ss.str());
}
