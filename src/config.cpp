#include "config.hpp"
#include "logging.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;

std::string Config::getConfigDirectory() {
    const char* home = getenv("HOME");
    if (!home) {
        throw std::runtime_error("Could not determine home directory");
    }

    return (fs::path(home) / ".sermondl").string();
}

std::string Config::getConfigPath() {
    return (fs::path(getConfigDirectory()) / "config.json").string();
}

Config Config::defaults() {
    Config config;
    config.download_path = fs::current_path().string();
    return config;
}

Config Config::fromJson(const nlohmann::json& j) {
    Config config = defaults();

    config.download_path = j.value("download_path", config.download_path);
    config.concurrency = j.value("concurrency", config.concurrency);
    config.audio_quality_order = j.value("audio_quality_order", config.audio_quality_order);
    config.video_quality_order = j.value("video_quality_order", config.video_quality_order);
    config.max_attempts = j.value("max_attempts", config.max_attempts);
    config.initial_backoff_ms = j.value("initial_backoff_ms", config.initial_backoff_ms);
    config.max_backoff_ms = j.value("max_backoff_ms", config.max_backoff_ms);
    config.page_size = j.value("page_size", config.page_size);
    config.max_pages = j.value("max_pages", config.max_pages);
    config.page_delay_ms = j.value("page_delay_ms", config.page_delay_ms);
    config.request_timeout_seconds = j.value("request_timeout_seconds", config.request_timeout_seconds);
    config.transfer_timeout_seconds = j.value("transfer_timeout_seconds", config.transfer_timeout_seconds);
    config.low_speed_limit_bytes = j.value("low_speed_limit_bytes", config.low_speed_limit_bytes);
    config.low_speed_time_seconds = j.value("low_speed_time_seconds", config.low_speed_time_seconds);
    config.tag_files = j.value("tag_files", config.tag_files);
    config.validate_cached_credential = j.value("validate_cached_credential", config.validate_cached_credential);
    config.show_logs = j.value("show_logs", config.show_logs);

    if (!fs::is_directory(config.download_path)) {
        SERMONDL_LOG(WARNING, "Download directory " << config.download_path << " does not exist, using "
                     << fs::current_path().string());
        config.download_path = fs::current_path().string();
    }
    if (config.max_attempts < 1) {
        config.max_attempts = 1;
    }
    if (config.page_size < 1) {
        config.page_size = Config{}.page_size;
    }
    if (config.max_pages < 1) {
        config.max_pages = Config{}.max_pages;
    }
    return config;
}

nlohmann::json Config::toJson() const {
    nlohmann::json j;
    j["download_path"] = download_path;
    j["concurrency"] = concurrency;
    j["audio_quality_order"] = audio_quality_order;
    j["video_quality_order"] = video_quality_order;
    j["max_attempts"] = max_attempts;
    j["initial_backoff_ms"] = initial_backoff_ms;
    j["max_backoff_ms"] = max_backoff_ms;
    j["page_size"] = page_size;
    j["max_pages"] = max_pages;
    j["page_delay_ms"] = page_delay_ms;
    j["request_timeout_seconds"] = request_timeout_seconds;
    j["transfer_timeout_seconds"] = transfer_timeout_seconds;
    j["low_speed_limit_bytes"] = low_speed_limit_bytes;
    j["low_speed_time_seconds"] = low_speed_time_seconds;
    j["tag_files"] = tag_files;
    j["validate_cached_credential"] = validate_cached_credential;
    j["show_logs"] = show_logs;
    return j;
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Config default_config = defaults();
        default_config.save(path);
        return default_config;
    }

    try {
        nlohmann::json j;
        file >> j;
        return fromJson(j);
    }
    catch (const nlohmann::json::exception& e) {
        SERMONDL_LOG(WARNING, "Error loading config " << path << ": " << e.what() << ", using defaults");
        return defaults();
    }
}

void Config::save(const std::string& path) const {
    fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        SERMONDL_LOG(WARNING, "Could not save config to " << path);
        return;
    }
    file << toJson().dump(4);
}
