#pragma once
#include "collection_reference.hpp"
#include "sermon.hpp"
#include "transfer_result.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class CancellationToken;
class CatalogPaginator;
class CredentialManager;
class DownloadScheduler;

struct RunReport {
    std::size_t listed = 0;
    std::size_t succeeded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::uint64_t bytes = 0;
    // In the order they completed.
    std::vector<TransferResult> failures;

    std::optional<std::string> pagination_error;
    // Where a rerun with --start-page can pick the listing up again.
    std::optional<int> resume_page;
    std::optional<std::string> fatal_error;
    bool cancelled = false;

    bool isCompleteSuccess() const {
        return failed == 0 && !pagination_error && !fatal_error && !cancelled;
    }
};

struct RunOptions {
    std::string output_root = ".";
    std::size_t concurrency = 3;
    int start_page = 1;
};

class RunCoordinator {
public:
    using ResultObserver = std::function<void(const TransferResult&)>;

    RunCoordinator(CredentialManager& credentials, CatalogPaginator& paginator, DownloadScheduler& scheduler,
                   CancellationToken& cancel);

    // Throws AuthenticationError if no credential can be obtained before the
    // run starts; every later failure ends up in the report.
    RunReport execute(const CollectionReference& reference, const MediaPreference& preference,
                      const RunOptions& options, const ResultObserver& observer = nullptr);

private:
    CredentialManager& credentials_;
    CatalogPaginator& paginator_;
    DownloadScheduler& scheduler_;
    CancellationToken& cancel_;
};
