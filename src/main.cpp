#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <filesystem>
#include <memory>
#include "config.hpp"
#include "cancellation.hpp"
#include "catalog_client.hpp"
#include "catalog_paginator.hpp"
#include "collection_reference.hpp"
#include "credential_manager.hpp"
#include "curl_http_client.hpp"
#include "download_scheduler.hpp"
#include "errors.hpp"
#include "item_resolver.hpp"
#include "logging.hpp"
#include "metadata_writer.hpp"
#include "run_coordinator.hpp"
#include "transfer_executor.hpp"
#include "utils.hpp"
#include "version.hpp"

namespace fs = std::filesystem;

namespace {
    bool looksLikeReference(const std::string& arg) {
        return arg.find('/') != std::string::npos ||
               arg.find_first_not_of("0123456789") == std::string::npos;
    }

    struct CommandLine {
        std::string command;
        std::string target;
        std::string config_path;
        std::string out;
        std::string quality;
        std::string video_tier;
        bool video = false;
        bool no_tags = false;
        bool verbose = false;
        bool quiet = false;
        bool refresh = false;
        int jobs = 0;
        int start_page = 1;
    };
}

void printHelp() {
    std::cout << "Usage: sermondl <command> [options]\n\n"
              << "Commands:\n"
              << "  download <sermon>        Download a single sermon (ID or URL)\n"
              << "  speaker <id|url>         Download all sermons of a speaker\n"
              << "  broadcaster <id|url>     Download all sermons of a broadcaster\n"
              << "  series <id|url>          Download all sermons of a series\n"
              << "  auth                     Show the cached API key\n"
              << "    --refresh             Fetch a new API key\n"
              << "  config [options]         Change saved settings\n"
              << "    --download-path <dir> Default output directory\n"
              << "    --concurrency <n>     Default number of parallel downloads\n"
              << "    --page-size <n>       Listing page size\n"
              << "    --audio-quality <t,..> Preferred audio tiers, best first\n"
              << "    --video-quality <t,..> Preferred video tiers, best first\n"
              << "    --tags <on|off>       Write tags with ffmpeg after download\n"
              << "  version                 Show version information\n"
              << "  help                    Show this help message\n\n"
              << "Download options:\n"
              << "  -o, --out <dir>         Output directory (default: configured download path)\n"
              << "  -j, --jobs <n>          Parallel downloads (1-" << DownloadScheduler::MAX_CONCURRENCY << ")\n"
              << "  --quality <t1,t2,..>    Preferred quality tiers, best first\n"
              << "  --video [tier]          Download video instead of audio\n"
              << "  --start-page <n>        Resume a collection listing at page n\n"
              << "  --no-tags               Do not write tags\n"
              << "Global options:\n"
              << "  --config <path>         Specify custom config file location\n"
              << "  --verbose               Show debug output\n"
              << "  --quiet                 Only show warnings and errors\n";
}

CommandLine parseCommandLine(int argc, char* argv[]) {
    CommandLine cl;
    cl.command = argv[1];

    for (int i = 2; i < argc; i++) {
        std::string option = argv[i];
        bool has_value = i + 1 < argc;

        if (option == "--config" && has_value) {
            cl.config_path = argv[++i];
        }
        else if ((option == "-o" || option == "--out") && has_value) {
            cl.out = argv[++i];
        }
        else if ((option == "-j" || option == "--jobs") && has_value) {
            cl.jobs = std::stoi(argv[++i]);
        }
        else if (option == "--quality" && has_value) {
            cl.quality = argv[++i];
        }
        else if (option == "--start-page" && has_value) {
            cl.start_page = std::stoi(argv[++i]);
        }
        else if (option == "--video") {
            cl.video = true;
            if (has_value && argv[i + 1][0] != '-' && !looksLikeReference(argv[i + 1])) {
                cl.video_tier = argv[++i];
            }
        }
        else if (option == "--no-tags") {
            cl.no_tags = true;
        }
        else if (option == "--verbose") {
            cl.verbose = true;
        }
        else if (option == "--quiet") {
            cl.quiet = true;
        }
        else if (option == "--refresh") {
            cl.refresh = true;
        }
        else if (cl.target.empty() && option[0] != '-') {
            cl.target = option;
        }
    }
    return cl;
}

int configure(Config& config, const std::string& config_path, int argc, char* argv[]) {
    bool updated = false;
    for (int i = 2; i < argc; i++) {
        std::string option = argv[i];
        if (i + 1 >= argc) {
            break;
        }
        if (option == "--download-path") {
            config.download_path = fs::absolute(argv[++i]).string();
            updated = true;
        }
        else if (option == "--concurrency") {
            config.concurrency = std::stoi(argv[++i]);
            updated = true;
        }
        else if (option == "--page-size") {
            config.page_size = std::stoi(argv[++i]);
            updated = true;
        }
        else if (option == "--audio-quality") {
            config.audio_quality_order = utils::splitString(argv[++i], ',');
            updated = true;
        }
        else if (option == "--video-quality") {
            config.video_quality_order = utils::splitString(argv[++i], ',');
            updated = true;
        }
        else if (option == "--tags") {
            config.tag_files = std::string(argv[++i]) == "on";
            updated = true;
        }
    }

    if (!updated) {
        std::string download_path;
        std::cout << "Download directory [" << config.download_path << "] (press Enter to keep): ";
        std::getline(std::cin, download_path);
        if (!download_path.empty()) config.download_path = fs::absolute(download_path).string();
    }

    config.save(config_path);
    std::cout << config.toJson().dump(4) << "\n";
    return 0;
}

void printResult(const TransferResult& result) {
    switch (result.status) {
        case TransferStatus::Success:
            std::cout << "[+] " << result.item_id << " " << result.title << " -> " << result.path
                      << " (" << utils::formatFileSize(result.bytes) << ")\n";
            break;
        case TransferStatus::Skipped:
            std::cout << "[=] " << result.item_id << " " << result.title << ": " << result.reason << "\n";
            break;
        case TransferStatus::Failed:
            std::cout << "[!] " << result.item_id << " " << result.title << ": " << result.reason << "\n";
            break;
    }
    std::cout.flush();
}

void printReport(const RunReport& report) {
    std::cout << "\nSermons listed:  " << report.listed << "\n"
              << "Downloaded:      " << report.succeeded << " (" << utils::formatFileSize(report.bytes) << ")\n"
              << "Skipped:         " << report.skipped << "\n"
              << "Failed:          " << report.failed << "\n";

    if (!report.failures.empty()) {
        std::cout << "\nFailures:\n";
        for (const auto& failure : report.failures) {
            std::cout << "  " << failure.item_id << " " << failure.title << " [" << errorKindName(failure.error_kind)
                      << ", " << failure.attempts << " attempt(s)]: " << failure.reason << "\n";
        }
    }
    if (report.pagination_error) {
        std::cout << "\nListing stopped early: " << *report.pagination_error << "\n";
        if (report.resume_page) {
            std::cout << "Rerun with --start-page " << *report.resume_page << " to continue.\n";
        }
    }
    if (report.fatal_error) {
        std::cout << "\nRun aborted: " << *report.fatal_error << "\n";
    }
    else if (report.cancelled) {
        std::cout << "\nRun interrupted.\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printHelp();
        return 1;
    }

    try {
        CommandLine cl = parseCommandLine(argc, argv);
        if (cl.command == "help" || cl.command == "--help" || cl.command == "-h") {
            printHelp();
            return 0;
        }
        if (cl.command == "version" || cl.command == "--version") {
            std::cout << "sermondl " << version::CURRENT_VERSION << "\n";
            return 0;
        }

        logging::init(logging::Severity::INFO);

        std::string config_path = cl.config_path.empty() ? Config::getConfigPath() : cl.config_path;
        auto config = Config::load(config_path);

        if (cl.verbose) {
            logging::setMinSeverity(logging::Severity::DEBUG);
        }
        else if (cl.quiet || !config.show_logs) {
            logging::setMinSeverity(logging::Severity::WARNING);
        }

        if (cl.command == "config") {
            return configure(config, config_path, argc, argv);
        }

        CurlHttpClient http(version::userAgent());
        http.setLowSpeedLimit(config.low_speed_limit_bytes, config.low_speed_time_seconds);
        CredentialStore store(CredentialStore::defaultPath());
        SermonAudioCredentialProvider provider(http, config.request_timeout_seconds);
        CredentialManager credentials(provider, store, config.validate_cached_credential);

        if (cl.command == "auth") {
            auto credential = cl.refresh ? credentials.forceRefresh() : credentials.getCredential();
            std::cout << "Active API key: " << credential->token << "\n"
                      << "Stored in: " << store.path() << "\n";
            return 0;
        }

        std::optional<CollectionReference> reference;
        if (cl.command == "download") {
            if (cl.target.empty()) {
                std::cerr << "Error: download requires a sermon ID or URL\n";
                return 1;
            }
            reference = CollectionReference::sermon(cl.target);
        }
        else if (cl.command == "speaker" || cl.command == "broadcaster" || cl.command == "series") {
            if (cl.target.empty()) {
                std::cerr << "Error: " << cl.command << " requires an ID or URL\n";
                return 1;
            }
            if (cl.command == "speaker") reference = CollectionReference::speaker(cl.target);
            else if (cl.command == "broadcaster") reference = CollectionReference::broadcaster(cl.target);
            else reference = CollectionReference::series(cl.target);
        }
        else {
            printHelp();
            return 1;
        }

        MediaPreference preference;
        preference.kind = cl.video ? MediaKind::Video : MediaKind::Audio;
        preference.quality_order = cl.video ? config.video_quality_order : config.audio_quality_order;
        if (!cl.quality.empty()) {
            preference.quality_order = utils::splitString(cl.quality, ',');
        }
        else if (!cl.video_tier.empty()) {
            preference.quality_order.insert(preference.quality_order.begin(), cl.video_tier);
        }

        RetryPolicy policy;
        policy.max_attempts = config.max_attempts;
        policy.initial_backoff = std::chrono::milliseconds(config.initial_backoff_ms);
        policy.max_backoff = std::chrono::milliseconds(config.max_backoff_ms);

        PaginatorSettings paging;
        paging.page_size = config.page_size;
        paging.max_pages = config.max_pages;
        paging.page_delay = std::chrono::milliseconds(config.page_delay_ms);

        std::unique_ptr<MetadataWriter> writer;
        if (config.tag_files && !cl.no_tags && FfmpegMetadataWriter::isAvailable()) {
            writer = std::make_unique<FfmpegMetadataWriter>();
        }
        else {
            if (config.tag_files && !cl.no_tags) {
                SERMONDL_LOG(WARNING, "ffmpeg not found in PATH, files will not be tagged");
            }
            writer = std::make_unique<NullMetadataWriter>();
        }

        CancellationToken cancel;
        ScopedSignalCancellation signals(cancel);

        CatalogClient catalog(http, credentials, config.request_timeout_seconds);
        CatalogPaginator paginator(catalog, credentials, policy, paging, cancel);
        ItemResolver resolver(catalog);
        TransferExecutor executor(http, *writer, config.transfer_timeout_seconds);
        DownloadScheduler scheduler(resolver, executor, credentials, policy, cancel);
        RunCoordinator coordinator(credentials, paginator, scheduler, cancel);

        RunOptions options;
        options.output_root = fs::absolute(cl.out.empty() ? config.download_path : cl.out).string();
        options.concurrency = static_cast<std::size_t>(cl.jobs > 0 ? cl.jobs : std::max(config.concurrency, 1));
        options.start_page = cl.start_page;

        RunReport report = coordinator.execute(*reference, preference, options, printResult);

        printReport(report);
        return report.isCompleteSuccess() ? 0 : 1;
    }
    catch (const AuthenticationError& e) {
        std::cerr << "Authentication failed: " << e.what() << "\n";
        return 1;
    }
    catch (const InvalidReferenceError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
