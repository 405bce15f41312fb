#include <gtest/gtest.h>

#include "catalog_paginator.hpp"
#include "fakes.hpp"

#include <functional>
#include <set>

using namespace std::chrono_literals;

namespace
{
    PaginatorSettings testSettings()
    {
        PaginatorSettings settings;
        settings.page_size = 25;
        settings.page_delay = 0ms;
        return settings;
    }

    std::vector<ItemDescriptor> drain(Listing& listing)
    {
        std::vector<ItemDescriptor> items;
        while (auto item = listing.next())
            items.push_back(std::move(*item));
        return items;
    }

    class CatalogPaginatorTest : public ::testing::Test
    {
    protected:
        fakes::Environment env;
        CatalogPaginator paginator{ env.catalog, env.credentials, fakes::fastRetryPolicy(), testSettings(), env.cancel };

        void serveListing(std::function<HttpResponse(int page)> pages)
        {
            env.http.route(CatalogClient::SERMONS_URL, [pages](const HttpRequest& request) {
                return pages(std::stoi(fakes::queryValue(request, "page")));
            });
        }

        // 25, 25 and 10 sermons on pages 1 to 3.
        void serveSixtySermons()
        {
            serveListing([](int page) {
                if (page > 3)
                    return fakes::respond(200, fakes::listingBody({}));
                return fakes::respond(200, fakes::listingBody(fakes::sermonIds((page - 1) * 25, page == 3 ? 10 : 25)));
            });
        }

        int listingRequests() const { return env.http.calls(CatalogClient::SERMONS_URL); }
    };
} // namespace

TEST_F(CatalogPaginatorTest, speakerListingFollowsPages)
{
    serveSixtySermons();

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    auto items = drain(*listing);

    ASSERT_EQ(items.size(), 60u);
    EXPECT_EQ(items.front().id, "1000000");
    EXPECT_EQ(items.back().id, "1000059");
    EXPECT_EQ(items[30].page, 2);
    EXPECT_EQ(listing->pagesFetched(), 3);
    EXPECT_EQ(listing->yielded(), 60u);
    EXPECT_FALSE(listing->error());

    auto requests = env.http.requests(CatalogClient::SERMONS_URL);
    ASSERT_EQ(requests.size(), 3u);
    for (std::size_t i = 0; i < requests.size(); ++i)
    {
        EXPECT_EQ(fakes::queryValue(requests[i], "page"), std::to_string(i + 1));
        EXPECT_EQ(fakes::queryValue(requests[i], "speakerID"), "48786");
        EXPECT_EQ(fakes::queryValue(requests[i], "pageSize"), "25");
        EXPECT_EQ(fakes::queryValue(requests[i], "sortBy"), "newest");
        EXPECT_EQ(fakes::apiKey(requests[i]), fakes::FakeCredentialProvider::tokenFor(1));
    }
}

TEST_F(CatalogPaginatorTest, pagesAreFetchedLazily)
{
    serveSixtySermons();

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    ASSERT_TRUE(listing->next());
    EXPECT_EQ(listingRequests(), 1);

    for (int i = 0; i < 24; ++i)
        ASSERT_TRUE(listing->next());
    EXPECT_EQ(listingRequests(), 1);

    ASSERT_TRUE(listing->next());
    EXPECT_EQ(listingRequests(), 2);
}

TEST_F(CatalogPaginatorTest, filterParameterFollowsCollectionKind)
{
    serveListing([](int) { return fakes::respond(200, fakes::listingBody(fakes::sermonIds(0, 2))); });

    drain(*paginator.listItems(CollectionReference::broadcaster("gracechurch")));
    drain(*paginator.listItems(CollectionReference::series("154321")));

    auto requests = env.http.requests(CatalogClient::SERMONS_URL);
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(fakes::queryValue(requests[0], "broadcasterID"), "gracechurch");
    EXPECT_EQ(fakes::queryValue(requests[1], "seriesID"), "154321");
}

TEST_F(CatalogPaginatorTest, overlappingPagesAreDeduplicated)
{
    serveListing([](int page) {
        switch (page)
        {
        case 1:
            return fakes::respond(200, fakes::listingBody(fakes::sermonIds(0, 25)));
        case 2:
            return fakes::respond(200, fakes::listingBody(fakes::sermonIds(20, 25)));
        default:
            return fakes::respond(200, fakes::listingBody(fakes::sermonIds(45, 5)));
        }
    });

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    auto items = drain(*listing);

    EXPECT_EQ(items.size(), 50u);
    EXPECT_EQ(listingRequests(), 3);

    std::set<std::string> ids;
    for (const auto& item : items)
        ids.insert(item.id);
    EXPECT_EQ(ids.size(), items.size());
}

TEST_F(CatalogPaginatorTest, lastPageMarkerEndsListing)
{
    serveListing([](int) { return fakes::respond(200, fakes::listingBody(fakes::sermonIds(0, 25), true)); });

    auto items = drain(*paginator.listItems(CollectionReference::speaker("48786")));

    EXPECT_EQ(items.size(), 25u);
    EXPECT_EQ(listingRequests(), 1);
}

TEST_F(CatalogPaginatorTest, emptyCollection)
{
    serveListing([](int) { return fakes::respond(200, fakes::listingBody({})); });

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    EXPECT_FALSE(listing->next());
    EXPECT_FALSE(listing->error());
    EXPECT_EQ(listingRequests(), 1);
}

TEST_F(CatalogPaginatorTest, failedPageKeepsEarlierItems)
{
    serveListing([](int page) {
        if (page == 2)
            return fakes::respond(404);
        return fakes::respond(200, fakes::listingBody(fakes::sermonIds((page - 1) * 25, 25)));
    });

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    auto items = drain(*listing);

    EXPECT_EQ(items.size(), 25u);
    ASSERT_TRUE(listing->error());
    EXPECT_EQ(listing->error()->page(), 2);
    EXPECT_EQ(listing->resumePage(), 2);
    EXPECT_EQ(listingRequests(), 2);
}

TEST_F(CatalogPaginatorTest, transientPageFailureIsRetried)
{
    int page_two_calls = 0;
    serveListing([&page_two_calls](int page) {
        if (page == 2 && ++page_two_calls == 1)
            return fakes::respond(503);
        return fakes::respond(200, fakes::listingBody(fakes::sermonIds((page - 1) * 25, page == 3 ? 10 : 25)));
    });

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    auto items = drain(*listing);

    EXPECT_EQ(items.size(), 60u);
    EXPECT_FALSE(listing->error());
    EXPECT_EQ(listingRequests(), 4);
}

TEST_F(CatalogPaginatorTest, persistentTransientFailureEndsListing)
{
    serveListing([](int page) {
        if (page == 2)
            return fakes::respond(500);
        return fakes::respond(200, fakes::listingBody(fakes::sermonIds(0, 25)));
    });

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    auto items = drain(*listing);

    EXPECT_EQ(items.size(), 25u);
    ASSERT_TRUE(listing->error());
    EXPECT_EQ(listing->error()->page(), 2);
    EXPECT_EQ(listingRequests(), 1 + 3);
}

TEST_F(CatalogPaginatorTest, malformedPageIsNotRetried)
{
    serveListing([](int page) {
        if (page == 2)
            return fakes::respond(200, "<html>maintenance</html>");
        return fakes::respond(200, fakes::listingBody(fakes::sermonIds(0, 25)));
    });

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    drain(*listing);

    ASSERT_TRUE(listing->error());
    EXPECT_EQ(listing->error()->page(), 2);
    EXPECT_EQ(listingRequests(), 2);
}

TEST_F(CatalogPaginatorTest, startPage)
{
    serveSixtySermons();

    auto listing = paginator.listItems(CollectionReference::speaker("48786"), 3);
    auto items = drain(*listing);

    EXPECT_EQ(items.size(), 10u);
    EXPECT_EQ(items.front().id, "1000050");
    auto requests = env.http.requests(CatalogClient::SERMONS_URL);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(fakes::queryValue(requests.front(), "page"), "3");
}

TEST_F(CatalogPaginatorTest, singleSermonNeedsNoListing)
{
    auto listing = paginator.listItems(CollectionReference::sermon("72412116314460"));

    auto item = listing->next();
    ASSERT_TRUE(item);
    EXPECT_EQ(item->id, "72412116314460");
    EXPECT_FALSE(item->assets);
    EXPECT_FALSE(listing->next());
    EXPECT_EQ(env.http.totalCalls(), 0);
}

TEST_F(CatalogPaginatorTest, rejectedKeyIsRefreshed)
{
    serveSixtySermons();
    env.http.rejectKey(fakes::FakeCredentialProvider::tokenFor(1));

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    auto items = drain(*listing);

    EXPECT_EQ(items.size(), 60u);
    EXPECT_FALSE(listing->error());
    EXPECT_EQ(env.provider.fetches.load(), 2);
}

TEST_F(CatalogPaginatorTest, maxPagesBoundsListing)
{
    serveListing([](int page) { return fakes::respond(200, fakes::listingBody(fakes::sermonIds((page - 1) * 25, 25))); });

    PaginatorSettings settings = testSettings();
    settings.max_pages = 2;
    CatalogPaginator bounded(env.catalog, env.credentials, fakes::fastRetryPolicy(), settings, env.cancel);

    auto listing = bounded.listItems(CollectionReference::speaker("48786"));
    auto items = drain(*listing);

    EXPECT_EQ(items.size(), 50u);
    EXPECT_EQ(listingRequests(), 2);
    EXPECT_FALSE(listing->error());
}

TEST_F(CatalogPaginatorTest, cancelledListingStops)
{
    serveSixtySermons();
    env.cancel.cancel();

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    EXPECT_FALSE(listing->next());
    EXPECT_TRUE(listing->cancelled());
    EXPECT_FALSE(listing->error());
    EXPECT_EQ(listingRequests(), 0);
}

TEST_F(CatalogPaginatorTest, unavailableEndpointFallsBackToAlternate)
{
    const std::string alternate = std::string(CatalogClient::WEB_URL) + "/node/sermons";
    env.http.route(CatalogClient::SERMONS_URL, [](const HttpRequest&) { return fakes::respond(404); });
    env.http.route(alternate, [](const HttpRequest& request) {
        int page = std::stoi(fakes::queryValue(request, "page"));
        return fakes::respond(200, fakes::listingBody(fakes::sermonIds((page - 1) * 25, page == 3 ? 10 : 25)));
    });

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    auto items = drain(*listing);

    EXPECT_EQ(items.size(), 60u);
    EXPECT_FALSE(listing->error());
    EXPECT_EQ(listingRequests(), 1);
    EXPECT_EQ(env.http.calls(alternate), 3);
}

TEST_F(CatalogPaginatorTest, webPagesListSermonsWhenNoEndpointAnswers)
{
    const std::string web = std::string(CatalogClient::WEB_URL) + "/speakers/48786/sermons";
    env.http.route(web, [](const HttpRequest& request) {
        std::string page = fakes::queryValue(request, "page");
        std::string html = "<html><body>";
        auto link = [&html](const std::string& id) { html += "<a href=\"/sermons/" + id + "\">Sermon</a>"; };
        if (page.empty())
        {
            for (const auto& id : fakes::sermonIds(0, 20))
            {
                link(id);
                link(id);
            }
        }
        else if (page == "2")
        {
            for (const auto& id : fakes::sermonIds(15, 10))
                link(id);
        }
        else
        {
            link("1000003");
        }
        return fakes::respond(200, html + "</body></html>");
    });

    auto listing = paginator.listItems(CollectionReference::speaker("48786"));
    auto items = drain(*listing);

    ASSERT_EQ(items.size(), 25u);
    EXPECT_EQ(items.front().id, "1000000");
    EXPECT_EQ(items.back().id, "1000024");
    EXPECT_TRUE(items.front().metadata.title.empty());
    EXPECT_EQ(items.back().page, 2);
    EXPECT_FALSE(listing->error());

    for (const auto& endpoint : CatalogClient::listingEndpoints())
        EXPECT_EQ(env.http.calls(endpoint), 1);

    auto requests = env.http.requests(web);
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_TRUE(requests[0].query.empty());
    EXPECT_EQ(fakes::queryValue(requests[1], "page"), "2");
    EXPECT_EQ(fakes::queryValue(requests[2], "page"), "3");
}

TEST_F(CatalogPaginatorTest, unreachableCatalogIsReported)
{
    auto listing = paginator.listItems(CollectionReference::series("154321"));
    auto items = drain(*listing);

    EXPECT_TRUE(items.empty());
    ASSERT_TRUE(listing->error());
    EXPECT_EQ(listing->error()->page(), 1);
    EXPECT_EQ(listing->resumePage(), 1);
    EXPECT_EQ(env.http.calls(std::string(CatalogClient::WEB_URL) + "/series/154321"), 1);
}

TEST_F(CatalogPaginatorTest, webFallbackOnlyForFirstPage)
{
    serveListing([](int) { return fakes::respond(404); });

    auto listing = paginator.listItems(CollectionReference::speaker("48786"), 2);
    drain(*listing);

    ASSERT_TRUE(listing->error());
    EXPECT_EQ(listing->error()->page(), 2);
    EXPECT_EQ(env.http.callsWithPrefix(std::string(CatalogClient::WEB_URL) + "/speakers/"), 0);
}
