#pragma once
#include "item_source.hpp"
#include "retry_policy.hpp"
#include "sermon.hpp"
#include "transfer_result.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

class CancellationToken;
class CredentialManager;
class DestinationPlanner;
class ItemResolver;
class TransferExecutor;

class DownloadScheduler {
public:
    using ResultCallback = std::function<void(const TransferResult&)>;

    static constexpr std::size_t MAX_CONCURRENCY = 16;

    DownloadScheduler(ItemResolver& resolver, TransferExecutor& executor, CredentialManager& credentials,
                      RetryPolicy policy, CancellationToken& cancel);

    // Runs up to `concurrency` item pipelines (resolve, select, transfer) at
    // once. Every descriptor pulled from `items` produces exactly one result;
    // results reach `on_result` on the calling thread, in completion order.
    // Returns when `items` is exhausted (or the run is cancelled) and every
    // started pipeline has finished.
    void run(ItemSource& items, const MediaPreference& preference, std::size_t concurrency,
             DestinationPlanner& planner, const ResultCallback& on_result);

    // Set when an unrecoverable error (authentication) cancelled the run.
    std::optional<std::string> fatalError() const;

    static std::size_t clampConcurrency(std::size_t concurrency);

private:
    ItemResolver& resolver_;
    TransferExecutor& executor_;
    CredentialManager& credentials_;
    RetryPolicy policy_;
    CancellationToken& cancel_;

    mutable std::mutex fatal_mutex_;
    std::optional<std::string> fatal_error_;

    TransferResult processItem(const ItemDescriptor& item, const MediaPreference& preference,
                               DestinationPlanner& planner);
    TransferResult runPipeline(const ItemDescriptor& item, const MediaPreference& preference,
                               DestinationPlanner& planner);
    void abortRun(const std::string& reason);
};
