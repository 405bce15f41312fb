#include "item_resolver.hpp"
#include "catalog_client.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cctype>

namespace {
    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    void fillMissing(std::string& target, const std::string& fallback) {
        if (target.empty()) {
            target = fallback;
        }
    }
}

ItemResolver::ItemResolver(CatalogClient& client) : client_(client) {}

std::vector<ResolvedAsset> ItemResolver::orderByPreference(const std::vector<ResolvedAsset>& assets,
                                                           const MediaPreference& preference) {
    std::vector<std::string> order;
    for (const auto& tier : preference.quality_order) {
        order.push_back(toLower(tier));
    }

    auto rank = [&order](const ResolvedAsset& asset) {
        auto it = std::find(order.begin(), order.end(), toLower(asset.tier));
        return static_cast<std::size_t>(it - order.begin());
    };

    std::vector<ResolvedAsset> matching;
    for (const auto& asset : assets) {
        if (asset.kind == preference.kind) {
            matching.push_back(asset);
        }
    }

    std::stable_sort(matching.begin(), matching.end(),
                     [&rank](const ResolvedAsset& a, const ResolvedAsset& b) { return rank(a) < rank(b); });
    return matching;
}

Resolution ItemResolver::resolve(const ItemDescriptor& descriptor, const MediaPreference& preference,
                                 const CancellationToken* cancel) {
    Resolution resolution;
    resolution.metadata = descriptor.metadata;

    std::vector<ResolvedAsset> variants;
    if (descriptor.assets && !descriptor.metadata.title.empty()) {
        variants = *descriptor.assets;
    }
    else {
        ItemDescriptor detail = catalog_parser::parseSermon(client_.fetchSermon(descriptor.id, cancel), descriptor.page);
        if (detail.id != descriptor.id) {
            throw PermanentItemError("Sermon " + descriptor.id + " detail describes sermon " + detail.id);
        }

        SermonMetadata metadata = detail.metadata;
        fillMissing(metadata.speaker, descriptor.metadata.speaker);
        fillMissing(metadata.broadcaster, descriptor.metadata.broadcaster);
        fillMissing(metadata.series, descriptor.metadata.series);
        fillMissing(metadata.preach_date, descriptor.metadata.preach_date);
        fillMissing(metadata.language, descriptor.metadata.language);
        resolution.metadata = metadata;

        if (detail.assets) {
            variants = std::move(*detail.assets);
        }
    }

    resolution.assets = orderByPreference(variants, preference);
    SERMONDL_LOG(DEBUG, "Sermon " << descriptor.id << ": " << resolution.assets.size() << " "
                 << mediaKindName(preference.kind) << " variant(s) of " << variants.size());
    return resolution;
}
