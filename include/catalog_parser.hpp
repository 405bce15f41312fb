#pragma once
#include "sermon.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct ListingPage {
    int page = 0;
    std::vector<ItemDescriptor> items;
    // Number of entries the service returned, duplicates included.
    std::size_t raw_count = 0;
    // Explicit "no more pages" marker ("next": null).
    bool last_page_marker = false;
    std::optional<std::int64_t> total_count;
};

namespace catalog_parser {
    // Throws PaginationError if the page does not have the expected shape.
    ListingPage parseListingPage(const std::string& body, int page);

    // Throws PermanentItemError if the sermon object is malformed.
    ItemDescriptor parseSermon(const nlohmann::json& sermon, int page);

    SermonMetadata parseMetadata(const nlohmann::json& sermon);

    std::vector<ResolvedAsset> parseMediaVariants(const nlohmann::json& media);

    // Sermon IDs linked as /sermons/<id> from a web page, first occurrence order.
    std::vector<std::string> parseSermonLinks(const std::string& html);

    // "low" from https://cloud.sermonaudio.com/media/audio/low/123.mp3
    std::string tierFromUrl(const std::string& url);
}
