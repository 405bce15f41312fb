#pragma once
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

class HttpClient;

struct Credential {
    std::string token;
    std::int64_t issued_at = 0;
    std::uint64_t generation = 0;
};

// Obtains a brand-new key from the service and checks a key's liveness.
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    // Throws AuthenticationError when no key can be obtained.
    virtual std::string fetchToken() = 0;

    virtual bool probe(const std::string& token) = 0;
};

// Scrapes the key the SermonAudio web front end embeds in its home page.
class SermonAudioCredentialProvider : public CredentialProvider {
public:
    static constexpr const char* HOME_PAGE_URL = "https://www.sermonaudio.com/";
    static constexpr const char* PROBE_URL = "https://api.sermonaudio.com/v2/node/sermons";

    SermonAudioCredentialProvider(HttpClient& http, long timeout_seconds);

    std::string fetchToken() override;
    bool probe(const std::string& token) override;

    static std::optional<std::string> extractToken(const std::string& html);

private:
    HttpClient& http_;
    long timeout_seconds_;
};

// The single persisted credential record.
class CredentialStore {
public:
    explicit CredentialStore(std::string path);

    static std::string defaultPath();

    // Missing or corrupt records read as nullopt.
    std::optional<Credential> load() const;
    void save(const Credential& credential) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class CredentialManager {
public:
    CredentialManager(CredentialProvider& provider, CredentialStore& store, bool validate_cached);

    CredentialManager(const CredentialManager&) = delete;
    CredentialManager& operator=(const CredentialManager&) = delete;

    // Blocks until a credential is available. Throws AuthenticationError.
    std::shared_ptr<const Credential> getCredential();

    // Supersedes `rejected` if it is still the active credential. Concurrent
    // reports of the same stale credential cause a single refresh.
    void reportRejected(const std::shared_ptr<const Credential>& rejected);

    // Drops the cached value and fetches a new one unconditionally.
    std::shared_ptr<const Credential> forceRefresh();

    static bool hasValidFormat(const std::string& token);

    std::uint64_t refreshCount() const;

private:
    CredentialProvider& provider_;
    CredentialStore& store_;
    bool validate_cached_;

    std::shared_ptr<const Credential> current_;
    mutable std::mutex refresh_mutex_;
    std::exception_ptr failure_;
    std::uint64_t refresh_count_ = 0;

    std::shared_ptr<const Credential> initializeLocked();
    std::shared_ptr<const Credential> refreshLocked(std::uint64_t generation);
};
