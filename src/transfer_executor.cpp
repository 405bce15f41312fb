#include "transfer_executor.hpp"
#include "cancellation.hpp"
#include "download_record.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "metadata_writer.hpp"
#include "utils.hpp"
#include <cstdio>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace {
    struct FileCloser {
        void operator()(FILE* fp) const { fclose(fp); }
    };

    class TempFileGuard {
    public:
        explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
        ~TempFileGuard() {
            if (!committed_) {
                std::error_code ec;
                fs::remove(path_, ec);
            }
        }

        TempFileGuard(const TempFileGuard&) = delete;
        TempFileGuard& operator=(const TempFileGuard&) = delete;

        void commit() { committed_ = true; }

    private:
        std::string path_;
        bool committed_ = false;
    };
}

TransferExecutor::TransferExecutor(HttpClient& http, MetadataWriter& writer, long timeout_seconds)
    : http_(http), writer_(writer), timeout_seconds_(timeout_seconds) {}

std::string TransferExecutor::tempPathFor(const std::string& destination, const std::string& item_id) {
    return destination + "." + item_id + ".part";
}

bool TransferExecutor::isComplete(const std::string& path, const std::string& item_id,
                                  std::optional<std::uint64_t> expected_size) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || fs::file_size(path, ec) == 0 || ec) {
        return false;
    }
    auto record = DownloadRecord::load(path);
    if (!record || record->item_id != item_id) {
        return false;
    }
    return !expected_size || record->bytes == *expected_size;
}

TransferResult TransferExecutor::transfer(const std::string& item_id, const SermonMetadata& metadata,
                                          const ResolvedAsset& asset, const std::string& destination,
                                          const CancellationToken& cancel) {
    if (isComplete(destination, item_id, asset.expected_size)) {
        SERMONDL_LOG(INFO, "Already exists, skipping: " << destination);
        TransferResult result = TransferResult::skipped("already downloaded");
        result.path = destination;
        return result;
    }

    if (cancel.isCancelled()) {
        throw CancelledError();
    }

    fs::path target(destination);
    if (target.has_parent_path() && !utils::createDirectoryIfNotExists(target.parent_path().string())) {
        throw PermanentItemError("Cannot create directory " + target.parent_path().string());
    }

    std::string temp_path = tempPathFor(destination, item_id);
    TempFileGuard guard(temp_path);

    std::unique_ptr<FILE, FileCloser> fp(fopen(temp_path.c_str(), "wb"));
    if (!fp) {
        throw PermanentItemError("Failed to open output file: " + temp_path);
    }

    bool write_failed = false;
    HttpClient::ChunkSink sink = [&](const char* data, std::size_t size) {
        if (cancel.isCancelled()) {
            return false;
        }
        if (fwrite(data, 1, size, fp.get()) != size) {
            write_failed = true;
            return false;
        }
        return true;
    };

    HttpRequest request;
    request.url = asset.url;
    request.timeout_seconds = timeout_seconds_;
    request.cancel = &cancel;

    SERMONDL_LOG(DEBUG, "Downloading " << asset.url);
    HttpResponse response = http_.stream(request, sink);

    if (fclose(fp.release()) != 0) {
        write_failed = true;
    }
    if (write_failed) {
        throw PermanentItemError("Failed writing " + temp_path);
    }
    if (response.aborted || cancel.isCancelled()) {
        throw CancelledError();
    }
    throwForStatus(response.status, "Download " + asset.url);

    std::error_code ec;
    std::uint64_t bytes = fs::file_size(temp_path, ec);
    if (ec) {
        throw PermanentItemError("Cannot stat " + temp_path + ": " + ec.message());
    }
    if (asset.expected_size && bytes != *asset.expected_size) {
        throw TransientFetchError("Incomplete transfer of " + asset.url + ": got " + std::to_string(bytes) +
                                  " of " + std::to_string(*asset.expected_size) + " bytes");
    }
    if (bytes == 0) {
        throw TransientFetchError("Empty response for " + asset.url);
    }

    DownloadRecord record;
    record.item_id = item_id;
    record.bytes = bytes;
    record.tier = asset.tier;
    record.save(destination);

    fs::rename(temp_path, target, ec);
    if (ec) {
        fs::remove(DownloadRecord::pathFor(destination), ec);
        throw PermanentItemError("Cannot move download into place at " + destination + ": " + ec.message());
    }
    guard.commit();

    try {
        writer_.write(metadata, destination);
    }
    catch (const std::exception& e) {
        SERMONDL_LOG(WARNING, "Tagging failed for " << destination << ": " << e.what());
    }

    SERMONDL_LOG(INFO, "Downloaded sermon " << item_id << " (" << asset.tier << ", "
                 << utils::formatFileSize(bytes) << ") -> " << destination);
    return TransferResult::success(destination, bytes);
}
