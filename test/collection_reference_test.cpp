#include <gtest/gtest.h>

#include "catalog_client.hpp"
#include "collection_reference.hpp"
#include "errors.hpp"

TEST(CollectionReference, sermonFromIdOrUrl)
{
    struct TestCase
    {
        std::string input;
        std::string id;
    } testCases[]{
        { "72412116314460", "72412116314460" },
        { "  1234567 ", "1234567" },
        { "https://www.sermonaudio.com/sermons/72412116314460/", "72412116314460" },
        { "https://www.sermonaudio.com/sermons/72412116314460?ref=share", "72412116314460" },
        { "https://cloud.sermonaudio.com/media/audio/low/72412116314460.mp3", "72412116314460" },
    };

    for (const TestCase& testCase : testCases)
    {
        auto reference = CollectionReference::sermon(testCase.input);
        EXPECT_TRUE(reference.isSingle());
        EXPECT_EQ(reference.id(), testCase.id) << " input was '" << testCase.input << "'";
    }
}

TEST(CollectionReference, sermonRejectsGarbage)
{
    EXPECT_THROW(CollectionReference::sermon("12345"), InvalidReferenceError);
    EXPECT_THROW(CollectionReference::sermon("not-a-sermon"), InvalidReferenceError);
    EXPECT_THROW(CollectionReference::sermon("https://www.sermonaudio.com/speakers/48786"), InvalidReferenceError);
    EXPECT_THROW(CollectionReference::sermon(""), InvalidReferenceError);
}

TEST(CollectionReference, speaker)
{
    auto reference = CollectionReference::speaker("48786");
    EXPECT_TRUE(std::holds_alternative<Speaker>(reference.target()));
    EXPECT_EQ(reference.id(), "48786");
    EXPECT_STREQ(reference.listingParameter(), "speakerID");
    EXPECT_STREQ(reference.kindName(), "speaker");

    EXPECT_EQ(CollectionReference::speaker("https://www.sermonaudio.com/speakers/48786/").id(), "48786");
    EXPECT_THROW(CollectionReference::speaker("John Smith"), InvalidReferenceError);
}

TEST(CollectionReference, broadcaster)
{
    struct TestCase
    {
        std::string input;
        std::string id;
    } testCases[]{
        { "gracechurch", "gracechurch" },
        { "https://www.sermonaudio.com/broadcasters/gracechurch/", "gracechurch" },
        { "https://www.sermonaudio.com/broadcasters/gracechurch/sermons?page=2", "gracechurch" },
        { "https://www.sermonaudio.com/gracechurch", "gracechurch" },
    };

    for (const TestCase& testCase : testCases)
    {
        auto reference = CollectionReference::broadcaster(testCase.input);
        EXPECT_TRUE(std::holds_alternative<Broadcaster>(reference.target()));
        EXPECT_EQ(reference.id(), testCase.id) << " input was '" << testCase.input << "'";
    }

    EXPECT_STREQ(CollectionReference::broadcaster("gracechurch").listingParameter(), "broadcasterID");
    EXPECT_THROW(CollectionReference::broadcaster("grace church"), InvalidReferenceError);
    EXPECT_THROW(CollectionReference::broadcaster("https://www.sermonaudio.com/"), InvalidReferenceError);
}

TEST(CollectionReference, series)
{
    auto reference = CollectionReference::series("https://www.sermonaudio.com/series/154321/");
    EXPECT_TRUE(std::holds_alternative<Series>(reference.target()));
    EXPECT_EQ(reference.id(), "154321");
    EXPECT_STREQ(reference.listingParameter(), "seriesID");

    EXPECT_EQ(CollectionReference::series("154321").id(), "154321");
    EXPECT_THROW(CollectionReference::series("12"), InvalidReferenceError);
    EXPECT_THROW(CollectionReference::series("https://www.sermonaudio.com/speakers/48786"), InvalidReferenceError);
}

TEST(CollectionReference, webListingUrl)
{
    EXPECT_EQ(CatalogClient::webListingUrl(CollectionReference::speaker("48786")), "https://www.sermonaudio.com/speakers/48786/sermons");
    EXPECT_EQ(CatalogClient::webListingUrl(CollectionReference::broadcaster("gracechurch")), "https://www.sermonaudio.com/broadcasters/gracechurch/sermons");
    EXPECT_EQ(CatalogClient::webListingUrl(CollectionReference::series("154321")), "https://www.sermonaudio.com/series/154321");
}
