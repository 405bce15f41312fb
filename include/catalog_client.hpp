#pragma once
#include "catalog_parser.hpp"
#include "collection_reference.hpp"
#include "http_client.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class CancellationToken;
class CredentialManager;

class CatalogClient {
public:
    static constexpr const char* SERMONS_URL = "https://api.sermonaudio.com/v2/node/sermons";
    static constexpr const char* WEB_URL = "https://www.sermonaudio.com";

    CatalogClient(HttpClient& http, CredentialManager& credentials, long timeout_seconds);

    // Listing endpoints to try, preferred first. SERMONS_URL serves details.
    static const std::vector<std::string>& listingEndpoints();

    ListingPage fetchListingPage(const std::string& endpoint, const CollectionReference& reference, int page,
                                 int page_size, const CancellationToken* cancel = nullptr);

    // Sermon IDs linked from the collection's website page, used when no
    // listing endpoint answers. Page 1 has no query string.
    std::vector<std::string> fetchWebListing(const CollectionReference& reference, int page,
                                             const CancellationToken* cancel = nullptr);
    static std::string webListingUrl(const CollectionReference& reference);

    nlohmann::json fetchSermon(const std::string& sermon_id, const CancellationToken* cancel = nullptr);

private:
    HttpClient& http_;
    CredentialManager& credentials_;
    long timeout_seconds_;

    // Attaches the current key; a 401 raises CredentialRejectedError naming it.
    HttpResponse authorizedGet(HttpRequest request, const std::string& context);
};
