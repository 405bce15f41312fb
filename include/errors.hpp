#pragma once
#include <stdexcept>
#include <string>
#include <memory>
#include <utility>

struct Credential;

enum class ErrorKind {
    Authentication,
    CredentialRejected,
    Transient,
    Permanent,
    Pagination,
    InvalidReference,
    Cancelled
};

const char* errorKindName(ErrorKind kind);

class SermonError : public std::runtime_error {
public:
    SermonError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Fatal: the key could not be obtained or refreshed.
class AuthenticationError : public SermonError {
public:
    explicit AuthenticationError(const std::string& message)
        : SermonError(ErrorKind::Authentication, message) {}
};

// The catalog service refused the key that was sent with the request.
class CredentialRejectedError : public SermonError {
public:
    CredentialRejectedError(const std::string& message, std::shared_ptr<const Credential> credential)
        : SermonError(ErrorKind::CredentialRejected, message), credential_(std::move(credential)) {}

    const std::shared_ptr<const Credential>& credential() const { return credential_; }

private:
    std::shared_ptr<const Credential> credential_;
};

class TransientFetchError : public SermonError {
public:
    explicit TransientFetchError(const std::string& message)
        : SermonError(ErrorKind::Transient, message) {}
};

class PermanentItemError : public SermonError {
public:
    explicit PermanentItemError(const std::string& message)
        : SermonError(ErrorKind::Permanent, message) {}
};

class PaginationError : public SermonError {
public:
    PaginationError(const std::string& message, int page)
        : SermonError(ErrorKind::Pagination, message), page_(page) {}

    int page() const { return page_; }

private:
    int page_;
};

class InvalidReferenceError : public SermonError {
public:
    explicit InvalidReferenceError(const std::string& message)
        : SermonError(ErrorKind::InvalidReference, message) {}
};

class CancelledError : public SermonError {
public:
    explicit CancelledError(const std::string& message = "run cancelled")
        : SermonError(ErrorKind::Cancelled, message) {}
};

// Raises the matching error for a non-2xx HTTP status. 401 is left to the
// caller, which knows which credential was sent.
void throwForStatus(long status, const std::string& context);
