#include "cancellation.hpp"
#include <algorithm>
#include <csignal>
#include <thread>

namespace {
    std::atomic<CancellationToken*> signal_target{nullptr};

    void cancelOnSignal(int sig) {
        if (CancellationToken* cancel = signal_target.load()) {
            cancel->cancel();
        }
        std::signal(sig, SIG_DFL);
    }
}

bool CancellationToken::sleepFor(std::chrono::milliseconds delay) const {
    const auto slice = std::chrono::milliseconds(50);
    auto deadline = std::chrono::steady_clock::now() + delay;

    while (!isCancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, slice));
    }
    return false;
}

ScopedSignalCancellation::ScopedSignalCancellation(CancellationToken& cancel) {
    signal_target.store(&cancel);
    previous_int_ = std::signal(SIGINT, cancelOnSignal);
    previous_term_ = std::signal(SIGTERM, cancelOnSignal);
}

ScopedSignalCancellation::~ScopedSignalCancellation() {
    std::signal(SIGINT, previous_int_ == SIG_ERR ? SIG_DFL : previous_int_);
    std::signal(SIGTERM, previous_term_ == SIG_ERR ? SIG_DFL : previous_term_);
    signal_target.store(nullptr);
}
