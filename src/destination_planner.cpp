#include "destination_planner.hpp"
#include "download_record.hpp"
#include "utils.hpp"
#include <filesystem>
#include <type_traits>

namespace fs = std::filesystem;

namespace {
    std::string orFallback(const std::string& value, const std::string& fallback) {
        return value.empty() ? fallback : value;
    }
}

DestinationPlanner::DestinationPlanner(std::string root, CollectionReference reference)
    : root_(std::move(root)), reference_(std::move(reference)) {}

std::string DestinationPlanner::relativePath(const SermonMetadata& metadata, const std::string& extension) const {
    fs::path folder;
    const std::string& id = reference_.id();

    std::visit([&](const auto& target) {
        using T = std::decay_t<decltype(target)>;
        if constexpr (std::is_same_v<T, Speaker>) {
            folder = utils::sanitizeFilename(orFallback(metadata.speaker, "Speaker " + id));
        }
        else if constexpr (std::is_same_v<T, Broadcaster>) {
            folder = utils::sanitizeFilename(orFallback(metadata.broadcaster, "Broadcaster " + id));
        }
        else if constexpr (std::is_same_v<T, Series>) {
            folder = utils::sanitizeFilename(orFallback(metadata.series, id));
        }
    }, reference_.target());

    if (!reference_.isSingle() && !std::holds_alternative<Series>(reference_.target()) && !metadata.series.empty()) {
        folder /= utils::sanitizeFilename(metadata.series);
    }

    std::string filename = utils::sanitizeFilename(orFallback(metadata.title, "Untitled Sermon"));
    return (folder / (filename + "." + extension)).string();
}

std::string DestinationPlanner::plan(const std::string& item_id, const SermonMetadata& metadata,
                                     const ResolvedAsset& asset) {
    std::string extension = asset.format.empty() ? (asset.kind == MediaKind::Audio ? "mp3" : "mp4") : asset.format;
    fs::path path = fs::path(root_) / relativePath(metadata, extension);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!isAvailableTo(path.string(), item_id)) {
        path.replace_filename(path.stem().string() + " (" + item_id + ")" + path.extension().string());
    }
    claimed_.emplace(path.string(), item_id);
    return path.string();
}

bool DestinationPlanner::isAvailableTo(const std::string& path, const std::string& item_id) const {
    auto it = claimed_.find(path);
    if (it != claimed_.end()) {
        return it->second == item_id;
    }

    if (auto record = DownloadRecord::load(path)) {
        return record->item_id == item_id;
    }
    std::error_code ec;
    return !fs::exists(path, ec);
}
