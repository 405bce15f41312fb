#include "credential_manager.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>

namespace fs = std::filesystem;

namespace {
    std::int64_t nowSeconds() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::string maskToken(const std::string& token) {
        if (token.size() <= 8) {
            return "********";
        }
        return token.substr(0, 8) + "...";
    }
}

SermonAudioCredentialProvider::SermonAudioCredentialProvider(HttpClient& http, long timeout_seconds)
    : http_(http), timeout_seconds_(timeout_seconds) {}

std::optional<std::string> SermonAudioCredentialProvider::extractToken(const std::string& html) {
    static const std::regex key_regex(R"re(apiKey:"([A-F0-9-]+)")re");
    std::smatch match;
    if (!std::regex_search(html, match, key_regex)) {
        return std::nullopt;
    }
    return match[1].str();
}

std::string SermonAudioCredentialProvider::fetchToken() {
    SERMONDL_LOG(INFO, "Fetching new API key from " << HOME_PAGE_URL);

    HttpRequest request;
    request.url = HOME_PAGE_URL;
    request.timeout_seconds = timeout_seconds_;

    HttpResponse response;
    try {
        response = http_.get(request);
    }
    catch (const SermonError& e) {
        throw AuthenticationError(std::string("Failed to fetch home page: ") + e.what());
    }

    if (response.status != 200) {
        throw AuthenticationError("Failed to fetch home page: HTTP " + std::to_string(response.status));
    }

    auto token = extractToken(response.body);
    if (!token) {
        throw AuthenticationError("Could not extract API key from SermonAudio home page");
    }
    return *token;
}

bool SermonAudioCredentialProvider::probe(const std::string& token) {
    HttpRequest request;
    request.url = PROBE_URL;
    request.query = {{"pageSize", "1"}, {"liteBroadcaster", "true"}};
    request.headers = {"X-API-Key: " + token};
    request.timeout_seconds = 5;

    try {
        HttpResponse response = http_.get(request);
        if (response.status != 200) {
            SERMONDL_LOG(WARNING, "Key validation failed: HTTP " << response.status);
            return false;
        }
        return true;
    }
    catch (const SermonError& e) {
        SERMONDL_LOG(WARNING, "Key validation request failed (" << e.what() << ")");
        return false;
    }
}

CredentialStore::CredentialStore(std::string path) : path_(std::move(path)) {}

std::string CredentialStore::defaultPath() {
    const char* home = getenv("HOME");
    if (!home) {
        throw std::runtime_error("Could not determine home directory");
    }
    return (fs::path(home) / ".sermondl" / "credential.json").string();
}

std::optional<Credential> CredentialStore::load() const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;

        Credential credential;
        credential.token = j.at("token").get<std::string>();
        credential.issued_at = j.value("issued_at", static_cast<std::int64_t>(0));
        return credential;
    }
    catch (const nlohmann::json::exception& e) {
        SERMONDL_LOG(WARNING, "Ignoring unreadable credential file " << path_ << ": " << e.what());
        return std::nullopt;
    }
}

void CredentialStore::save(const Credential& credential) const {
    fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    nlohmann::json j;
    j["token"] = credential.token;
    j["issued_at"] = credential.issued_at;

    std::string temp_path = path_ + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            SERMONDL_LOG(WARNING, "Could not save credential to " << path_);
            return;
        }
        file << j.dump(4);
    }

    fs::rename(temp_path, target, ec);
    if (ec) {
        SERMONDL_LOG(WARNING, "Could not save credential to " << path_ << ": " << ec.message());
        fs::remove(temp_path, ec);
    }
}

CredentialManager::CredentialManager(CredentialProvider& provider, CredentialStore& store, bool validate_cached)
    : provider_(provider), store_(store), validate_cached_(validate_cached) {}

bool CredentialManager::hasValidFormat(const std::string& token) {
    static const std::regex format_regex("^[A-F0-9-]{30,}$");
    return std::regex_match(token, format_regex);
}

std::uint64_t CredentialManager::refreshCount() const {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    return refresh_count_;
}

std::shared_ptr<const Credential> CredentialManager::getCredential() {
    auto current = std::atomic_load(&current_);
    if (current) {
        return current;
    }

    std::lock_guard<std::mutex> lock(refresh_mutex_);
    if (failure_) {
        std::rethrow_exception(failure_);
    }
    current = std::atomic_load(&current_);
    if (current) {
        return current;
    }
    return initializeLocked();
}

void CredentialManager::reportRejected(const std::shared_ptr<const Credential>& rejected) {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    if (failure_) {
        std::rethrow_exception(failure_);
    }

    auto current = std::atomic_load(&current_);
    if (current && rejected && current->generation != rejected->generation) {
        SERMONDL_LOG(DEBUG, "Credential generation " << rejected->generation << " already superseded");
        return;
    }

    SERMONDL_LOG(WARNING, "API key rejected by the service, refreshing");
    refreshLocked(current ? current->generation : 0);
}

std::shared_ptr<const Credential> CredentialManager::forceRefresh() {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    failure_ = nullptr;
    auto current = std::atomic_load(&current_);
    return refreshLocked(current ? current->generation : 0);
}

std::shared_ptr<const Credential> CredentialManager::initializeLocked() {
    if (auto stored = store_.load()) {
        if (!hasValidFormat(stored->token)) {
            SERMONDL_LOG(WARNING, "Stored key has invalid format");
        }
        else if (validate_cached_ && !provider_.probe(stored->token)) {
            SERMONDL_LOG(WARNING, "Stored key is expired or invalid");
        }
        else {
            auto credential = std::make_shared<Credential>(*stored);
            credential->generation = 1;
            std::atomic_store(&current_, std::shared_ptr<const Credential>(credential));
            SERMONDL_LOG(DEBUG, "Using cached API key " << maskToken(credential->token));
            return credential;
        }
    }
    return refreshLocked(0);
}

std::shared_ptr<const Credential> CredentialManager::refreshLocked(std::uint64_t generation) {
    auto credential = std::make_shared<Credential>();
    try {
        credential->token = provider_.fetchToken();
    }
    catch (const AuthenticationError&) {
        failure_ = std::current_exception();
        throw;
    }
    credential->issued_at = nowSeconds();
    credential->generation = generation + 1;
    ++refresh_count_;

    store_.save(*credential);
    std::atomic_store(&current_, std::shared_ptr<const Credential>(credential));
    SERMONDL_LOG(INFO, "Using new API key " << maskToken(credential->token));
    return credential;
}
