#include "catalog_client.hpp"
#include "credential_manager.hpp"
#include "errors.hpp"
#include "logging.hpp"

CatalogClient::CatalogClient(HttpClient& http, CredentialManager& credentials, long timeout_seconds)
    : http_(http), credentials_(credentials), timeout_seconds_(timeout_seconds) {}

HttpResponse CatalogClient::authorizedGet(HttpRequest request, const std::string& context) {
    auto credential = credentials_.getCredential();
    request.headers.push_back("X-API-Key: " + credential->token);
    request.timeout_seconds = timeout_seconds_;

    HttpResponse response = http_.get(request);
    if (response.aborted) {
        throw CancelledError();
    }
    if (response.status == 401) {
        throw CredentialRejectedError(context + ": HTTP 401 (key rejected)", credential);
    }
    throwForStatus(response.status, context);
    return response;
}

const std::vector<std::string>& CatalogClient::listingEndpoints() {
    static const std::vector<std::string> endpoints = {
        SERMONS_URL,
        std::string(WEB_URL) + "/node/sermons",
        std::string(WEB_URL) + "/api/node/sermons",
    };
    return endpoints;
}

ListingPage CatalogClient::fetchListingPage(const std::string& endpoint, const CollectionReference& reference,
                                            int page, int page_size, const CancellationToken* cancel) {
    HttpRequest request;
    request.url = endpoint;
    request.query = {
        {"sortBy", "newest"},
        {"requireAudio", "false"},
        {reference.listingParameter(), reference.id()},
        {"pageSize", std::to_string(page_size)},
        {"page", std::to_string(page)},
        {"liteBroadcaster", "true"},
        {"cacheLanguage", "en"},
        {"cache", "true"},
    };
    request.cancel = cancel;

    SERMONDL_LOG(DEBUG, endpoint << " page " << page << " (pageSize=" << page_size << ")");
    HttpResponse response = authorizedGet(request, std::string("Listing page ") + std::to_string(page));
    return catalog_parser::parseListingPage(response.body, page);
}

std::string CatalogClient::webListingUrl(const CollectionReference& reference) {
    std::string url = std::string(WEB_URL) + "/" + reference.webPath() + "/" + reference.id();
    if (!std::holds_alternative<Series>(reference.target())) {
        url += "/sermons";
    }
    return url;
}

std::vector<std::string> CatalogClient::fetchWebListing(const CollectionReference& reference, int page,
                                                        const CancellationToken* cancel) {
    HttpRequest request;
    request.url = webListingUrl(reference);
    if (page > 1) {
        request.query = {{"page", std::to_string(page)}};
    }
    request.timeout_seconds = timeout_seconds_;
    request.cancel = cancel;

    SERMONDL_LOG(INFO, "Fetching web page " << page << ": " << request.url);
    HttpResponse response = http_.get(request);
    if (response.aborted) {
        throw CancelledError();
    }
    throwForStatus(response.status, "Web listing page " + std::to_string(page));
    return catalog_parser::parseSermonLinks(response.body);
}

nlohmann::json CatalogClient::fetchSermon(const std::string& sermon_id, const CancellationToken* cancel) {
    HttpRequest request;
    request.url = std::string(SERMONS_URL) + "/" + sermon_id;
    request.cancel = cancel;

    HttpResponse response = authorizedGet(request, "Sermon " + sermon_id);
    try {
        return nlohmann::json::parse(response.body);
    }
    catch (const nlohmann::json::exception& e) {
        throw PermanentItemError("Sermon " + sermon_id + " detail is not valid JSON: " + e.what());
    }
}
