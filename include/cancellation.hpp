#pragma once
#include <atomic>
#include <chrono>

// Run-scoped stop flag. cancel() only stores an atomic, so it may be called
// from a signal handler.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool isCancelled() const noexcept { return cancelled_.load(); }

    // Sleeps in short slices; returns false if cancelled before the delay ran out.
    bool sleepFor(std::chrono::milliseconds delay) const;

private:
    std::atomic<bool> cancelled_{false};
};

// Routes SIGINT and SIGTERM to `cancel` while in scope; a second signal gets
// the default action. The previous dispositions are restored on exit.
class ScopedSignalCancellation {
public:
    explicit ScopedSignalCancellation(CancellationToken& cancel);
    ~ScopedSignalCancellation();

    ScopedSignalCancellation(const ScopedSignalCancellation&) = delete;
    ScopedSignalCancellation& operator=(const ScopedSignalCancellation&) = delete;

private:
    void (*previous_int_)(int);
    void (*previous_term_)(int);
};
