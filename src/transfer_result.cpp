#include "transfer_result.hpp"

TransferResult TransferResult::success(const std::string& path, std::uint64_t bytes) {
    TransferResult result;
    result.status = TransferStatus::Success;
    result.path = path;
    result.bytes = bytes;
    return result;
}

TransferResult TransferResult::skipped(const std::string& reason) {
    TransferResult result;
    result.status = TransferStatus::Skipped;
    result.reason = reason;
    return result;
}

TransferResult TransferResult::failed(ErrorKind kind, const std::string& message, int attempts) {
    TransferResult result;
    result.status = TransferStatus::Failed;
    result.error_kind = kind;
    result.reason = message;
    result.attempts = attempts;
    return result;
}
