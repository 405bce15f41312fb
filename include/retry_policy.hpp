#pragma once
#include "cancellation.hpp"
#include "credential_manager.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <chrono>
#include <set>
#include <string>

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
    double backoff_multiplier = 2.0;
    // Fraction of the delay that is randomized: delay * (1 - jitter .. 1).
    double jitter = 0.5;
    std::set<ErrorKind> retryable{ErrorKind::Transient};
    int max_credential_refreshes = 1;

    bool isRetryable(ErrorKind kind) const { return retryable.count(kind) != 0; }

    // Delay before the attempt that follows failed attempt `failed_attempt` (1-based).
    std::chrono::milliseconds backoffFor(int failed_attempt) const;
};

struct RetryState {
    int attempts = 0;
    int transient_failures = 0;
    int credential_refreshes = 0;
};

// Runs `operation` until it succeeds, fails permanently, or exhausts the
// policy. A rejected credential is reported and retried immediately without
// consuming an attempt of the backoff schedule.
template <typename Operation>
auto runWithRetry(const RetryPolicy& policy, CredentialManager& credentials, const CancellationToken& cancel,
                  RetryState& state, const std::string& what, Operation&& operation) -> decltype(operation()) {
    while (true) {
        if (cancel.isCancelled()) {
            throw CancelledError();
        }

        ++state.attempts;
        try {
            return operation();
        }
        catch (const CredentialRejectedError& e) {
            if (state.credential_refreshes >= policy.max_credential_refreshes) {
                throw PermanentItemError(std::string(e.what()) + " after refreshing the key");
            }
            ++state.credential_refreshes;
            credentials.reportRejected(e.credential());
        }
        catch (const SermonError& e) {
            if (!policy.isRetryable(e.kind())) {
                throw;
            }
            ++state.transient_failures;
            if (state.transient_failures >= policy.max_attempts) {
                throw;
            }

            auto delay = policy.backoffFor(state.transient_failures);
            SERMONDL_LOG(WARNING, what << ": " << e.what() << ", retrying in " << delay.count() << " ms");
            if (!cancel.sleepFor(delay)) {
                throw CancelledError();
            }
        }
    }
}
