#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Kept beside every finished download as the hidden file
// "<dir>/.<filename>.sermondl". Tagging rewrites the media file in place, so
// the record, not the file's current size, tells whether the download is
// complete and which sermon owns the path.
struct DownloadRecord {
    std::string item_id;
    std::uint64_t bytes = 0;
    std::string tier;

    static std::string pathFor(const std::string& destination);

    // nullopt when there is no record or it cannot be parsed.
    static std::optional<DownloadRecord> load(const std::string& destination);

    void save(const std::string& destination) const;
};
