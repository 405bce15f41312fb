#include "download_scheduler.hpp"
#include "cancellation.hpp"
#include "credential_manager.hpp"
#include "destination_planner.hpp"
#include "item_resolver.hpp"
#include "logging.hpp"
#include "result_channel.hpp"
#include "transfer_executor.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <vector>

DownloadScheduler::DownloadScheduler(ItemResolver& resolver, TransferExecutor& executor,
                                     CredentialManager& credentials, RetryPolicy policy, CancellationToken& cancel)
    : resolver_(resolver), executor_(executor), credentials_(credentials), policy_(std::move(policy)),
      cancel_(cancel) {}

std::size_t DownloadScheduler::clampConcurrency(std::size_t concurrency) {
    return std::clamp<std::size_t>(concurrency, 1, MAX_CONCURRENCY);
}

std::optional<std::string> DownloadScheduler::fatalError() const {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    return fatal_error_;
}

void DownloadScheduler::abortRun(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(fatal_mutex_);
        if (!fatal_error_) {
            fatal_error_ = reason;
        }
    }
    SERMONDL_LOG(ERROR, reason << "; stopping the run");
    cancel_.cancel();
}

void DownloadScheduler::run(ItemSource& items, const MediaPreference& preference, std::size_t concurrency,
                            DestinationPlanner& planner, const ResultCallback& on_result) {
    std::size_t workers = clampConcurrency(concurrency);
    if (workers != concurrency) {
        SERMONDL_LOG(WARNING, "Concurrency " << concurrency << " clamped to " << workers);
    }

    ResultChannel<TransferResult> results;
    std::mutex source_mutex;
    std::atomic<std::size_t> live_workers{workers};
    std::atomic<std::size_t> dispatched{0};

    auto worker = [&]() {
        while (true) {
            std::optional<ItemDescriptor> item;
            {
                std::lock_guard<std::mutex> lock(source_mutex);
                if (cancel_.isCancelled()) {
                    break;
                }
                try {
                    item = items.next();
                }
                catch (const std::exception& e) {
                    abortRun(e.what());
                    break;
                }
            }
            if (!item) {
                break;
            }

            SERMONDL_LOG(INFO, "=== [" << ++dispatched << "] Downloading sermon " << item->id << " ===");
            results.push(processItem(*item, preference, planner));
        }

        if (--live_workers == 0) {
            results.close();
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }

    std::exception_ptr callback_failure;
    while (auto result = results.pop()) {
        if (callback_failure) {
            continue;
        }
        try {
            on_result(*result);
        }
        catch (const std::exception&) {
            callback_failure = std::current_exception();
            cancel_.cancel();
        }
    }

    for (auto& thread : threads) {
        thread.join();
    }

    if (callback_failure) {
        std::rethrow_exception(callback_failure);
    }
}

TransferResult DownloadScheduler::processItem(const ItemDescriptor& item, const MediaPreference& preference,
                                              DestinationPlanner& planner) {
    TransferResult result;
    try {
        result = runPipeline(item, preference, planner);
    }
    catch (const AuthenticationError& e) {
        abortRun(e.what());
        result = TransferResult::failed(ErrorKind::Authentication, e.what(), 0);
    }
    catch (const std::exception& e) {
        result = TransferResult::failed(ErrorKind::Permanent, e.what(), 0);
    }

    result.item_id = item.id;
    if (result.title.empty()) {
        result.title = item.metadata.title;
    }

    if (result.status == TransferStatus::Failed) {
        SERMONDL_LOG(WARNING, "Failed to download sermon " << item.id << ": " << result.reason);
    }
    return result;
}

TransferResult DownloadScheduler::runPipeline(const ItemDescriptor& item, const MediaPreference& preference,
                                              DestinationPlanner& planner) {
    RetryState resolve_state;
    Resolution resolution;
    try {
        resolution = runWithRetry(policy_, credentials_, cancel_, resolve_state, "Sermon " + item.id,
                                  [&] { return resolver_.resolve(item, preference, &cancel_); });
    }
    catch (const AuthenticationError&) {
        throw;
    }
    catch (const SermonError& e) {
        return TransferResult::failed(e.kind(), e.what(), resolve_state.attempts);
    }

    if (resolution.assets.empty()) {
        SERMONDL_LOG(INFO, "Sermon " << item.id << " has no " << mediaKindName(preference.kind) << " asset");
        TransferResult result = TransferResult::skipped("no matching asset");
        result.title = resolution.metadata.title;
        result.attempts = resolve_state.attempts;
        return result;
    }

    std::optional<TransferResult> last_failure;
    for (const auto& asset : resolution.assets) {
        std::string destination = planner.plan(item.id, resolution.metadata, asset);
        RetryState state;
        try {
            TransferResult result = runWithRetry(policy_, credentials_, cancel_, state, "Sermon " + item.id, [&] {
                return executor_.transfer(item.id, resolution.metadata, asset, destination, cancel_);
            });
            result.attempts = state.attempts;
            result.tier = asset.tier;
            result.title = resolution.metadata.title;
            return result;
        }
        catch (const PermanentItemError& e) {
            SERMONDL_LOG(WARNING, "Sermon " << item.id << " " << asset.tier << " variant failed: " << e.what());
            last_failure = TransferResult::failed(ErrorKind::Permanent, e.what(), state.attempts);
            last_failure->tier = asset.tier;
        }
        catch (const AuthenticationError&) {
            throw;
        }
        catch (const SermonError& e) {
            TransferResult result = TransferResult::failed(e.kind(), e.what(), state.attempts);
            result.tier = asset.tier;
            result.title = resolution.metadata.title;
            return result;
        }
    }

    last_failure->title = resolution.metadata.title;
    return *last_failure;
}
