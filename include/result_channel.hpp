#pragma once
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

// Many producers, one consumer. pop() blocks until an item arrives or the
// channel is closed and drained.
template <typename T>
class ResultChannel {
public:
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock{mtx_};
            queue_.push(std::move(value));
        }
        cv_.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock{mtx_};
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock{mtx_};
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::queue<T> queue_;
    bool closed_ = false;
};
