#include "run_coordinator.hpp"
#include "cancellation.hpp"
#include "catalog_paginator.hpp"
#include "credential_manager.hpp"
#include "destination_planner.hpp"
#include "download_scheduler.hpp"
#include "logging.hpp"

RunCoordinator::RunCoordinator(CredentialManager& credentials, CatalogPaginator& paginator,
                               DownloadScheduler& scheduler, CancellationToken& cancel)
    : credentials_(credentials), paginator_(paginator), scheduler_(scheduler), cancel_(cancel) {}

RunReport RunCoordinator::execute(const CollectionReference& reference, const MediaPreference& preference,
                                  const RunOptions& options, const ResultObserver& observer) {
    credentials_.getCredential();

    SERMONDL_LOG(INFO, "Downloading " << reference.kindName() << " " << reference.id() << " ("
                 << mediaKindName(preference.kind) << ") into " << options.output_root);

    RunReport report;
    auto listing = paginator_.listItems(reference, options.start_page);
    DestinationPlanner planner(options.output_root, reference);

    scheduler_.run(*listing, preference, options.concurrency, planner, [&](const TransferResult& result) {
        switch (result.status) {
            case TransferStatus::Success:
                ++report.succeeded;
                report.bytes += result.bytes;
                break;
            case TransferStatus::Skipped:
                ++report.skipped;
                break;
            case TransferStatus::Failed:
                ++report.failed;
                report.failures.push_back(result);
                break;
        }
        if (observer) {
            observer(result);
        }
    });

    report.listed = listing->yielded();
    if (listing->error()) {
        report.pagination_error = listing->error()->what();
        report.resume_page = listing->error()->page();
    }
    report.fatal_error = scheduler_.fatalError();
    report.cancelled = cancel_.isCancelled();

    SERMONDL_LOG(INFO, "Done: " << report.succeeded << " downloaded, " << report.skipped << " skipped, "
                 << report.failed << " failed");
    return report;
}
