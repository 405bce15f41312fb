#include "catalog_paginator.hpp"
#include "logging.hpp"

Listing::Listing(CatalogClient& client, CredentialManager& credentials, const RetryPolicy& policy,
                 const PaginatorSettings& settings, const CancellationToken& cancel,
                 CollectionReference reference, int start_page)
    : client_(client), credentials_(credentials), policy_(policy), settings_(settings), cancel_(cancel),
      reference_(std::move(reference)), next_page_(start_page < 1 ? 1 : start_page) {
    if (reference_.isSingle()) {
        ItemDescriptor descriptor;
        descriptor.id = reference_.id();
        buffer_.push_back(std::move(descriptor));
        finished_ = true;
    }
}

std::optional<ItemDescriptor> Listing::next() {
    while (buffer_.empty()) {
        if (finished_) {
            return std::nullopt;
        }
        fetchNextPage();
    }

    ItemDescriptor descriptor = std::move(buffer_.front());
    buffer_.pop_front();
    ++yielded_;
    return descriptor;
}

void Listing::fetchNextPage() {
    if (pages_fetched_ >= settings_.max_pages) {
        SERMONDL_LOG(WARNING, "Stopping " << reference_.kindName() << " " << reference_.id()
                     << " listing after " << pages_fetched_ << " pages");
        finished_ = true;
        return;
    }

    if (cancel_.isCancelled() ||
        (pages_fetched_ > 0 && settings_.page_delay.count() > 0 && !cancel_.sleepFor(settings_.page_delay))) {
        cancelled_ = true;
        finished_ = true;
        return;
    }

    if (web_page_ > 0) {
        fetchNextWebPage();
        return;
    }

    std::optional<ListingPage> page;
    try {
        page = fetchFromEndpoints();
    }
    catch (const CancelledError&) {
        cancelled_ = true;
        finished_ = true;
        return;
    }
    catch (const AuthenticationError&) {
        finished_ = true;
        throw;
    }

    if (!page) {
        if (pages_fetched_ == 0 && next_page_ == 1) {
            SERMONDL_LOG(WARNING, "No listing endpoint answered; falling back to the "
                         << reference_.kindName() << " web pages");
            web_page_ = 1;
            fetchNextWebPage();
            return;
        }
        finished_ = true;
        return;
    }

    ++pages_fetched_;
    if (pages_fetched_ == 1 && page->total_count) {
        SERMONDL_LOG(INFO, reference_.kindName() << " " << reference_.id() << ": " << *page->total_count
                     << " sermons listed by the service");
    }

    std::size_t added = 0;
    for (auto& item : page->items) {
        if (!seen_.insert(item.id).second) {
            SERMONDL_LOG(DEBUG, "Skipping duplicate sermon " << item.id << " on page " << page->page);
            continue;
        }
        buffer_.push_back(std::move(item));
        ++added;
    }
    SERMONDL_LOG(INFO, "Page " << page->page << ": " << added << " new sermons (total so far: "
                 << seen_.size() << ")");

    if (page->raw_count < static_cast<std::size_t>(settings_.page_size) || page->last_page_marker) {
        finished_ = true;
    }
    ++next_page_;
}

std::optional<ListingPage> Listing::fetchFromEndpoints() {
    const auto& endpoints = CatalogClient::listingEndpoints();
    while (true) {
        const std::string& endpoint = endpoints[endpoint_];
        RetryState state;
        try {
            ListingPage page = runWithRetry(policy_, credentials_, cancel_, state,
                                            "Listing page " + std::to_string(next_page_), [&] {
                                                return client_.fetchListingPage(endpoint, reference_, next_page_,
                                                                                settings_.page_size, &cancel_);
                                            });
            if (!endpoint_confirmed_ && endpoint_ > 0) {
                SERMONDL_LOG(INFO, "Listing from " << endpoint);
            }
            endpoint_confirmed_ = true;
            return page;
        }
        catch (const CancelledError&) {
            throw;
        }
        catch (const AuthenticationError&) {
            throw;
        }
        catch (const SermonError& e) {
            SERMONDL_LOG(ERROR, "Listing page " << next_page_ << " failed after " << state.attempts
                         << " attempt(s): " << e.what());
            const auto* pagination = dynamic_cast<const PaginationError*>(&e);
            error_ = PaginationError(e.what(), pagination ? pagination->page() : next_page_);

            if (endpoint_confirmed_ || endpoint_ + 1 >= endpoints.size()) {
                return std::nullopt;
            }
            ++endpoint_;
            SERMONDL_LOG(WARNING, endpoint << " is not answering, probing " << endpoints[endpoint_]);
        }
    }
}

void Listing::fetchNextWebPage() {
    std::vector<std::string> ids;
    RetryState state;
    try {
        ids = runWithRetry(policy_, credentials_, cancel_, state, "Web listing page " + std::to_string(web_page_),
                           [this] { return client_.fetchWebListing(reference_, web_page_, &cancel_); });
    }
    catch (const CancelledError&) {
        cancelled_ = true;
        finished_ = true;
        return;
    }
    catch (const SermonError& e) {
        SERMONDL_LOG(ERROR, "Web listing page " << web_page_ << " failed: " << e.what());
        if (!error_) {
            error_ = PaginationError(e.what(), 1);
        }
        finished_ = true;
        return;
    }

    ++pages_fetched_;
    std::size_t added = 0;
    for (auto& id : ids) {
        if (!seen_.insert(id).second) {
            continue;
        }
        ItemDescriptor descriptor;
        descriptor.id = std::move(id);
        descriptor.page = web_page_;
        buffer_.push_back(std::move(descriptor));
        ++added;
    }
    SERMONDL_LOG(INFO, "Web page " << web_page_ << ": " << added << " new sermons (total so far: "
                 << seen_.size() << ")");

    if (added == 0) {
        finished_ = true;
        return;
    }
    // The listing endpoints failed, but the web pages produced the collection.
    error_.reset();
    ++web_page_;
}

CatalogPaginator::CatalogPaginator(CatalogClient& client, CredentialManager& credentials, RetryPolicy policy,
                                   PaginatorSettings settings, const CancellationToken& cancel)
    : client_(client), credentials_(credentials), policy_(std::move(policy)), settings_(settings), cancel_(cancel) {}

std::unique_ptr<Listing> CatalogPaginator::listItems(const CollectionReference& reference, int start_page) {
    return std::make_unique<Listing>(client_, credentials_, policy_, settings_, cancel_, reference, start_page);
}
