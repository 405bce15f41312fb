#include "catalog_parser.hpp"
#include "errors.hpp"
#include <regex>
#include <unordered_set>

namespace {
    std::string stringField(const nlohmann::json& object, const char* key) {
        auto it = object.find(key);
        if (it == object.end() || !it->is_string()) {
            return "";
        }
        return it->get<std::string>();
    }

    std::string nestedString(const nlohmann::json& object, const char* key, const char* field) {
        auto it = object.find(key);
        if (it == object.end() || !it->is_object()) {
            return "";
        }
        return stringField(*it, field);
    }

    std::string extensionFromUrl(const std::string& url) {
        std::string path = url.substr(0, url.find_first_of("?#"));
        auto slash = path.rfind('/');
        auto dot = path.rfind('.');
        if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
            return "";
        }
        return path.substr(dot + 1);
    }

    void parseVariantList(const nlohmann::json& media, const char* key, MediaKind kind,
                          std::vector<ResolvedAsset>& assets) {
        auto it = media.find(key);
        if (it == media.end() || !it->is_array()) {
            return;
        }

        for (const auto& entry : *it) {
            if (!entry.is_object()) {
                continue;
            }

            ResolvedAsset asset;
            asset.kind = kind;
            asset.url = stringField(entry, "downloadURL");
            if (asset.url.empty()) {
                asset.url = stringField(entry, "streamURL");
            }
            if (asset.url.empty()) {
                continue;
            }

            std::string media_type = stringField(entry, "mediaType");
            asset.tier = stringField(entry, "quality");
            if (asset.tier.empty()) {
                asset.tier = catalog_parser::tierFromUrl(asset.url);
            }
            if (asset.tier.empty()) {
                asset.tier = media_type;
            }

            asset.format = extensionFromUrl(asset.url);
            if (asset.format.empty()) {
                asset.format = !media_type.empty() ? media_type : (kind == MediaKind::Audio ? "mp3" : "mp4");
            }

            auto size = entry.find("fileSizeBytes");
            if (size != entry.end() && size->is_number_integer() && size->get<std::int64_t>() > 0) {
                asset.expected_size = size->get<std::uint64_t>();
            }

            assets.push_back(std::move(asset));
        }
    }
}

namespace catalog_parser {

std::string tierFromUrl(const std::string& url) {
    static const std::regex tier_regex(R"(/media/(?:audio|video)/([A-Za-z0-9_-]+)/)");
    std::smatch match;
    if (std::regex_search(url, match, tier_regex)) {
        return match[1].str();
    }
    return "";
}

SermonMetadata parseMetadata(const nlohmann::json& sermon) {
    SermonMetadata metadata;
    metadata.title = stringField(sermon, "displayTitle");
    if (metadata.title.empty()) {
        metadata.title = stringField(sermon, "fullTitle");
    }
    metadata.speaker = nestedString(sermon, "speaker", "displayName");
    metadata.broadcaster = nestedString(sermon, "broadcaster", "displayName");
    metadata.series = nestedString(sermon, "series", "title");
    metadata.preach_date = stringField(sermon, "preachDate");
    metadata.language = stringField(sermon, "languageCode");
    return metadata;
}

ItemDescriptor parseSermon(const nlohmann::json& sermon, int page) {
    if (!sermon.is_object()) {
        throw PermanentItemError("Sermon entry is not an object");
    }

    auto id = sermon.find("sermonID");
    if (id == sermon.end()) {
        throw PermanentItemError("Missing required field: sermonID");
    }

    ItemDescriptor descriptor;
    if (id->is_string()) {
        descriptor.id = id->get<std::string>();
    }
    else if (id->is_number_integer()) {
        descriptor.id = std::to_string(id->get<std::int64_t>());
    }
    if (descriptor.id.empty()) {
        throw PermanentItemError("Field sermonID is not a usable identifier");
    }

    descriptor.metadata = parseMetadata(sermon);
    if (descriptor.metadata.title.empty()) {
        throw PermanentItemError("Sermon " + descriptor.id + " has no title");
    }
    descriptor.page = page;

    auto media = sermon.find("media");
    if (media != sermon.end() && media->is_object()) {
        descriptor.assets = parseMediaVariants(*media);
    }
    return descriptor;
}

std::vector<ResolvedAsset> parseMediaVariants(const nlohmann::json& media) {
    std::vector<ResolvedAsset> assets;
    if (!media.is_object()) {
        return assets;
    }
    parseVariantList(media, "audio", MediaKind::Audio, assets);
    parseVariantList(media, "video", MediaKind::Video, assets);
    return assets;
}

ListingPage parseListingPage(const std::string& body, int page) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    }
    catch (const nlohmann::json::exception& e) {
        throw PaginationError(std::string("Listing page is not valid JSON: ") + e.what(), page);
    }

    if (!json.is_object()) {
        throw PaginationError("Listing page is not an object", page);
    }

    auto results = json.find("results");
    if (results == json.end() || !results->is_array()) {
        throw PaginationError("Listing page has no results array", page);
    }

    ListingPage listing;
    listing.page = page;
    listing.raw_count = results->size();

    for (const auto& entry : *results) {
        try {
            listing.items.push_back(parseSermon(entry, page));
        }
        catch (const PermanentItemError& e) {
            throw PaginationError(std::string("Malformed listing entry: ") + e.what(), page);
        }
    }

    auto next = json.find("next");
    listing.last_page_marker = next != json.end() && next->is_null();

    auto total = json.find("totalCount");
    if (total != json.end() && total->is_number_integer()) {
        listing.total_count = total->get<std::int64_t>();
    }
    return listing;
}

std::vector<std::string> parseSermonLinks(const std::string& html) {
    static const std::regex link_regex(R"(/sermons/(\d+))");
    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;
    for (std::sregex_iterator it(html.begin(), html.end(), link_regex), end; it != end; ++it) {
        std::string id = (*it)[1].str();
        if (seen.insert(id).second) {
            ids.push_back(id);
        }
    }
    return ids;
}

}
