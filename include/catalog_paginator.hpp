#pragma once
#include "catalog_client.hpp"
#include "collection_reference.hpp"
#include "errors.hpp"
#include "item_source.hpp"
#include "retry_policy.hpp"
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

struct PaginatorSettings {
    int page_size = 100;
    int max_pages = 1000;
    std::chrono::milliseconds page_delay{350};
};

// One pass over a collection. Pages are requested lazily, strictly in
// increasing order, as next() drains the already-parsed items.
//
// The first page is tried on each of CatalogClient::listingEndpoints() in
// turn and the first that answers serves the rest of the pass. When none
// does on page 1, the collection's web pages are scraped for sermon links
// instead, until a page adds no new sermons.
class Listing : public ItemSource {
public:
    Listing(CatalogClient& client, CredentialManager& credentials, const RetryPolicy& policy,
            const PaginatorSettings& settings, const CancellationToken& cancel,
            CollectionReference reference, int start_page);

    // Throws AuthenticationError; every other failure ends the pass and is
    // kept in error().
    std::optional<ItemDescriptor> next() override;

    const std::optional<PaginationError>& error() const { return error_; }
    // Listing page the next request would ask for; after a failure, the failed page.
    int resumePage() const { return next_page_; }
    int pagesFetched() const { return pages_fetched_; }
    std::size_t yielded() const { return yielded_; }
    bool cancelled() const { return cancelled_; }

private:
    CatalogClient& client_;
    CredentialManager& credentials_;
    RetryPolicy policy_;
    PaginatorSettings settings_;
    const CancellationToken& cancel_;
    CollectionReference reference_;

    std::deque<ItemDescriptor> buffer_;
    std::unordered_set<std::string> seen_;
    std::optional<PaginationError> error_;
    int next_page_;
    int pages_fetched_ = 0;
    std::size_t yielded_ = 0;
    bool finished_ = false;
    bool cancelled_ = false;
    std::size_t endpoint_ = 0;
    bool endpoint_confirmed_ = false;
    // Non-zero once listing has fallen back to the web pages.
    int web_page_ = 0;

    void fetchNextPage();
    std::optional<ListingPage> fetchFromEndpoints();
    void fetchNextWebPage();
};

class CatalogPaginator {
public:
    CatalogPaginator(CatalogClient& client, CredentialManager& credentials, RetryPolicy policy,
                     PaginatorSettings settings, const CancellationToken& cancel);

    std::unique_ptr<Listing> listItems(const CollectionReference& reference, int start_page = 1);

private:
    CatalogClient& client_;
    CredentialManager& credentials_;
    RetryPolicy policy_;
    PaginatorSettings settings_;
    const CancellationToken& cancel_;
};
