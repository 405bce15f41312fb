#include <gtest/gtest.h>

#include "catalog_paginator.hpp"
#include "download_scheduler.hpp"
#include "fakes.hpp"
#include "item_resolver.hpp"
#include "run_coordinator.hpp"
#include "transfer_executor.hpp"

using namespace std::chrono_literals;

namespace
{
    const std::string kMediaHost = "https://media.test/";

    PaginatorSettings testSettings()
    {
        PaginatorSettings settings;
        settings.page_size = 25;
        settings.page_delay = 0ms;
        return settings;
    }

    std::string pageOf(const std::vector<nlohmann::json>& sermons)
    {
        nlohmann::json page;
        page["results"] = sermons;
        page["totalCount"] = sermons.size();
        return page.dump();
    }

    class RunCoordinatorTest : public ::testing::Test
    {
    protected:
        fakes::Environment env;
        CatalogPaginator paginator{ env.catalog, env.credentials, fakes::fastRetryPolicy(), testSettings(), env.cancel };
        ItemResolver resolver{ env.catalog };
        TransferExecutor executor{ env.http, env.writer, 60 };
        DownloadScheduler scheduler{ resolver, executor, env.credentials, fakes::fastRetryPolicy(), env.cancel };
        RunCoordinator coordinator{ env.credentials, paginator, scheduler, env.cancel };

        RunOptions options() const
        {
            RunOptions options;
            options.output_root = env.outputRoot().string();
            options.concurrency = 3;
            return options;
        }

        // Pages of 25 until `total` sermons are listed, all downloadable.
        std::vector<std::string> serveSpeaker(int total)
        {
            auto ids = fakes::sermonIds(0, total);
            for (const auto& id : ids)
                fakes::serveMedia(env.http, id);

            env.http.route(CatalogClient::SERMONS_URL, [total](const HttpRequest& request) {
                int page = std::stoi(fakes::queryValue(request, "page"));
                int first = (page - 1) * 25;
                int count = std::max(0, std::min(25, total - first));
                return fakes::respond(200, fakes::listingBody(fakes::sermonIds(first, count)));
            });
            return ids;
        }

        int mediaRequests() const { return env.http.callsWithPrefix(kMediaHost); }
    };
} // namespace

TEST_F(RunCoordinatorTest, completeRun)
{
    serveSpeaker(30);
    std::vector<std::string> observed;

    RunReport report = coordinator.execute(CollectionReference::speaker("48786"), MediaPreference::defaultAudio(), options(),
                                           [&](const TransferResult& result) { observed.push_back(result.item_id); });

    EXPECT_EQ(report.listed, 30u);
    EXPECT_EQ(report.succeeded, 30u);
    EXPECT_EQ(report.skipped, 0u);
    EXPECT_EQ(report.failed, 0u);
    EXPECT_TRUE(report.failures.empty());
    EXPECT_TRUE(report.isCompleteSuccess());
    EXPECT_EQ(observed.size(), 30u);

    std::uint64_t expected_bytes = 0;
    for (const auto& id : fakes::sermonIds(0, 30))
        expected_bytes += fakes::mediaBody(id, "low").size();
    EXPECT_EQ(report.bytes, expected_bytes);

    auto files = fakes::listFiles(env.outputRoot());
    ASSERT_EQ(files.size(), 30u);
    EXPECT_EQ(files.front(), "John Smith/Romans/Sermon 1000000.mp3");
}

TEST_F(RunCoordinatorTest, outcomesAreAggregated)
{
    std::vector<nlohmann::json> sermons;
    for (const auto& id : fakes::sermonIds(0, 4))
    {
        sermons.push_back(fakes::sermonJson(id, { "low" }));
        fakes::serveMedia(env.http, id, { "low" });
    }
    sermons.push_back(fakes::sermonJson("2000000", {}));
    sermons.push_back(fakes::sermonJson("3000000", { "low" }));
    env.http.route(fakes::mediaUrl("3000000", "low"), [](const HttpRequest&) { return fakes::respond(404); });
    env.http.routeBody(CatalogClient::SERMONS_URL, pageOf(sermons));

    RunReport report = coordinator.execute(CollectionReference::speaker("48786"), MediaPreference::defaultAudio(), options());

    EXPECT_EQ(report.listed, 6u);
    EXPECT_EQ(report.succeeded, 4u);
    EXPECT_EQ(report.skipped, 1u);
    EXPECT_EQ(report.failed, 1u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures.front().item_id, "3000000");
    EXPECT_EQ(report.failures.front().title, "Sermon 3000000");
    EXPECT_EQ(report.failures.front().error_kind, ErrorKind::Permanent);
    EXPECT_FALSE(report.isCompleteSuccess());
    EXPECT_FALSE(report.fatal_error);
}

TEST_F(RunCoordinatorTest, paginationFailureIsReported)
{
    auto ids = fakes::sermonIds(0, 25);
    for (const auto& id : ids)
        fakes::serveMedia(env.http, id);
    env.http.route(CatalogClient::SERMONS_URL, [ids](const HttpRequest& request) {
        if (fakes::queryValue(request, "page") == "2")
            return fakes::respond(500);
        return fakes::respond(200, fakes::listingBody(ids));
    });

    RunReport report = coordinator.execute(CollectionReference::speaker("48786"), MediaPreference::defaultAudio(), options());

    EXPECT_EQ(report.listed, 25u);
    EXPECT_EQ(report.succeeded, 25u);
    ASSERT_TRUE(report.pagination_error);
    ASSERT_TRUE(report.resume_page);
    EXPECT_EQ(*report.resume_page, 2);
    EXPECT_FALSE(report.isCompleteSuccess());
}

TEST_F(RunCoordinatorTest, resumeFromPage)
{
    serveSpeaker(60);

    RunOptions resumed = options();
    resumed.start_page = 2;
    RunReport report = coordinator.execute(CollectionReference::speaker("48786"), MediaPreference::defaultAudio(), resumed);

    EXPECT_EQ(report.listed, 35u);
    EXPECT_EQ(report.succeeded, 35u);
    EXPECT_EQ(fakes::queryValue(env.http.requests(CatalogClient::SERMONS_URL).front(), "page"), "2");
}

TEST_F(RunCoordinatorTest, rerunSkipsFinishedDownloads)
{
    serveSpeaker(30);

    RunReport first = coordinator.execute(CollectionReference::speaker("48786"), MediaPreference::defaultAudio(), options());
    ASSERT_EQ(first.succeeded, 30u);
    int transfers = mediaRequests();
    auto tagged = env.writer.paths().size();

    RunReport second = coordinator.execute(CollectionReference::speaker("48786"), MediaPreference::defaultAudio(), options());

    EXPECT_EQ(second.listed, 30u);
    EXPECT_EQ(second.succeeded, 0u);
    EXPECT_EQ(second.skipped, 30u);
    EXPECT_EQ(second.failed, 0u);
    EXPECT_TRUE(second.isCompleteSuccess());
    EXPECT_EQ(mediaRequests(), transfers);
    EXPECT_EQ(env.writer.paths().size(), tagged);
    EXPECT_EQ(fakes::listFiles(env.outputRoot()).size(), 30u);
}

TEST_F(RunCoordinatorTest, rerunAfterTaggingGrewFiles)
{
    serveSpeaker(30);
    env.writer.tag_block = "ID3v2.3 TIT2 TPE1 TALB";

    RunReport first = coordinator.execute(CollectionReference::speaker("48786"), MediaPreference::defaultAudio(), options());
    ASSERT_EQ(first.succeeded, 30u);
    ASSERT_EQ(mediaRequests(), 30);
    ASSERT_EQ(env.writer.paths().size(), 30u);

    RunReport second = coordinator.execute(CollectionReference::speaker("48786"), MediaPreference::defaultAudio(), options());

    EXPECT_EQ(second.skipped, 30u);
    EXPECT_EQ(second.succeeded, 0u);
    EXPECT_EQ(mediaRequests(), 30);
    EXPECT_EQ(env.writer.paths().size(), 30u);
    EXPECT_EQ(fakes::listFiles(env.outputRoot()).size(), 30u);
}

TEST_F(RunCoordinatorTest, singleSermon)
{
    const std::string id = "72412116314460";
    env.http.routeBody(fakes::sermonUrl(id), fakes::sermonJson(id).dump());
    fakes::serveMedia(env.http, id);

    RunReport report = coordinator.execute(CollectionReference::sermon(id), MediaPreference::defaultAudio(), options());

    EXPECT_EQ(report.listed, 1u);
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(fakes::listFiles(env.outputRoot()), (std::vector<std::string>{ "Sermon " + id + ".mp3" }));
}

TEST_F(RunCoordinatorTest, missingCredentialFailsBeforeListing)
{
    env.provider.fail = true;

    EXPECT_THROW(coordinator.execute(CollectionReference::speaker("48786"), MediaPreference::defaultAudio(), options()),
                 AuthenticationError);
    EXPECT_EQ(env.http.totalCalls(), 0);
}

TEST_F(RunCoordinatorTest, cancelledRunIsReported)
{
    serveSpeaker(30);
    env.cancel.cancel();

    RunReport report = coordinator.execute(CollectionReference::speaker("48786"), MediaPreference::defaultAudio(), options());

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.succeeded, 0u);
    EXPECT_FALSE(report.isCompleteSuccess());
}
