#pragma once
#include "sermon.hpp"
#include "transfer_result.hpp"
#include <optional>
#include <string>

class CancellationToken;
class HttpClient;
class MetadataWriter;

class TransferExecutor {
public:
    TransferExecutor(HttpClient& http, MetadataWriter& writer, long timeout_seconds);

    // Downloads `asset` to `destination` through a colocated temp file that is
    // renamed into place only once complete and recorded. Returns Success or
    // Skipped and throws SermonError subclasses on failure; the temp file never
    // survives a failure or cancellation.
    TransferResult transfer(const std::string& item_id, const SermonMetadata& metadata, const ResolvedAsset& asset,
                            const std::string& destination, const CancellationToken& cancel);

    static std::string tempPathFor(const std::string& destination, const std::string& item_id);

    // Complete means the file exists and its DownloadRecord names `item_id`
    // with the expected byte count. The file's own size is not compared since
    // tagging changes it.
    static bool isComplete(const std::string& path, const std::string& item_id,
                           std::optional<std::uint64_t> expected_size);

private:
    HttpClient& http_;
    MetadataWriter& writer_;
    long timeout_seconds_;
};
