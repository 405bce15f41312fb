#pragma once
#include "errors.hpp"
#include <cstdint>
#include <string>

enum class TransferStatus { Success, Skipped, Failed };

struct TransferResult {
    TransferStatus status = TransferStatus::Failed;
    std::string item_id;
    std::string title;
    std::string path;
    std::string tier;
    std::uint64_t bytes = 0;
    // Skip reason or error message.
    std::string reason;
    ErrorKind error_kind = ErrorKind::Permanent;
    int attempts = 0;

    static TransferResult success(const std::string& path, std::uint64_t bytes);
    static TransferResult skipped(const std::string& reason);
    static TransferResult failed(ErrorKind kind, const std::string& message, int attempts);
};
