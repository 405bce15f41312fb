#pragma once
#include "collection_reference.hpp"
#include "sermon.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

// Maps sermons to final paths under the output root:
//   sermon       <root>/<title>.<ext>
//   speaker      <root>/<speaker>/[<series>/]<title>.<ext>
//   broadcaster  <root>/<broadcaster>/[<series>/]<title>.<ext>
//   series       <root>/<series>/<title>.<ext>
// Shared by all workers of one run.
class DestinationPlanner {
public:
    DestinationPlanner(std::string root, CollectionReference reference);

    // Claims the path for `item_id`. A path already claimed by another sermon
    // in this run, or held on disk by a file that is not recorded as this
    // sermon's download, gets " (<item_id>)" appended to its stem.
    std::string plan(const std::string& item_id, const SermonMetadata& metadata, const ResolvedAsset& asset);

    std::string relativePath(const SermonMetadata& metadata, const std::string& extension) const;

private:
    bool isAvailableTo(const std::string& path, const std::string& item_id) const;

    std::string root_;
    CollectionReference reference_;
    std::mutex mutex_;
    std::unordered_map<std::string, std::string> claimed_;
};
