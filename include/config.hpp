#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct Config {
    std::string download_path;
    int concurrency = 3;
    std::vector<std::string> audio_quality_order{"low", "high"};
    std::vector<std::string> video_quality_order{"low", "high", "1080p"};
    int max_attempts = 3;
    int initial_backoff_ms = 1000;
    int max_backoff_ms = 30000;
    int page_size = 100;
    int max_pages = 1000;
    int page_delay_ms = 350;
    long request_timeout_seconds = 20;
    long transfer_timeout_seconds = 3600;
    long low_speed_limit_bytes = 1024;
    long low_speed_time_seconds = 60;
    bool tag_files = true;
    bool validate_cached_credential = true;
    bool show_logs = true;

    // Missing file: defaults, written back. Missing keys: defaults.
    // Unreadable file: defaults, with a warning.
    static Config load(const std::string& path);
    void save(const std::string& path) const;

    static Config defaults();
    static Config fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;

    static std::string getConfigDirectory();
    static std::string getConfigPath();
};
