#include "download_record.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

std::string DownloadRecord::pathFor(const std::string& destination) {
    fs::path target(destination);
    return (target.parent_path() / ("." + target.filename().string() + ".sermondl")).string();
}

std::optional<DownloadRecord> DownloadRecord::load(const std::string& destination) {
    std::ifstream file(pathFor(destination));
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;

        DownloadRecord record;
        record.item_id = j.at("id").get<std::string>();
        record.bytes = j.at("bytes").get<std::uint64_t>();
        record.tier = j.value("tier", "");
        return record;
    }
    catch (const nlohmann::json::exception& e) {
        SERMONDL_LOG(WARNING, "Ignoring unreadable record for " << destination << ": " << e.what());
        return std::nullopt;
    }
}

void DownloadRecord::save(const std::string& destination) const {
    nlohmann::json j;
    j["id"] = item_id;
    j["bytes"] = bytes;
    j["tier"] = tier;

    std::string path = pathFor(destination);
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw PermanentItemError("Could not write " + path);
    }
    file << j.dump();
    file.close();
    if (!file) {
        throw PermanentItemError("Could not write " + path);
    }
}
