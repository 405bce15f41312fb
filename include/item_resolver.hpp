#pragma once
#include "sermon.hpp"
#include <vector>

class CancellationToken;
class CatalogClient;

struct Resolution {
    SermonMetadata metadata;
    // Best match first; empty when the sermon has no asset of the requested kind.
    std::vector<ResolvedAsset> assets;
};

class ItemResolver {
public:
    explicit ItemResolver(CatalogClient& client);

    // Uses the variants embedded in the descriptor when present, otherwise
    // fetches the sermon detail.
    Resolution resolve(const ItemDescriptor& descriptor, const MediaPreference& preference,
                       const CancellationToken* cancel = nullptr);

    // Keeps only `preference.kind`, ordered by quality_order; unknown tiers
    // follow in source order.
    static std::vector<ResolvedAsset> orderByPreference(const std::vector<ResolvedAsset>& assets,
                                                        const MediaPreference& preference);

private:
    CatalogClient& client_;
};
