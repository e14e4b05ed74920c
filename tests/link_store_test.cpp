#include <gtest/gtest.h>

#include "links/link.hpp"
#include "links/store.hpp"
#include "test_util.hpp"

using links::JsonStore;
using links::Link;
using types::LinkStatus;

static_assert(nlohmann::detail::has_from_json<nlohmann::json, Link>::value,
              "Link must be readable with json::get<Link>()");
static_assert(nlohmann::detail::has_to_json<nlohmann::json, Link>::value,
              "Link must be assignable to json");

TEST(Link, JsonRoundTripIsFieldEqual) {
    Link l;
    l.url = "https://example.com/a";
    l.status = LinkStatus::ToSkipLimit;
    l.source = "file";
    l.source_file = "/tmp/links.txt";
    l.processed_timestamp = "2024-05-01T13:45:10";
    l.filter_matched = "Imgur";
    l.filter_id = 7;
    l.download_path = "/dl/a";
    l.images_count = 12;
    l.file_size_mb = 12.5;
    l.error_message = "error(image_count): 12 images";
    l.tags = {"art", "later"};
    l.metadata = {{"title", "A"}};

    const nlohmann::json j = l;
    EXPECT_EQ(j.at("status").get<std::string>(), "to_skip_limit");
    EXPECT_TRUE(j.at("downloaded_timestamp").is_null());

    const Link back = nlohmann::json::parse(j.dump()).get<Link>();
    EXPECT_TRUE(back == l);
}

TEST(Link, DefaultsApplyAtTheBoundary) {
    const Link l = nlohmann::json::parse(R"({"url":"https://x.y"})").get<Link>();
    EXPECT_EQ(l.status, LinkStatus::Pending);
    EXPECT_EQ(l.source, "unknown");
    EXPECT_FALSE(l.id.empty());
    EXPECT_FALSE(l.deleted);
    EXPECT_FALSE(l.filter_id.has_value());
}

TEST(Link, UrlIsRequired) {
    EXPECT_THROW(nlohmann::json::parse(R"({"status":"pending"})").get<Link>(), std::invalid_argument);
}

TEST(LinkStore, AddIsIdempotentForActiveLinks) {
    testutil::TempDir dir;
    JsonStore store(dir.file("links.json"));
    ASSERT_TRUE(store.load());
    Link* a = store.add("https://x.y/1");
    Link* b = store.add("https://x.y/1", "clipboard");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->source, "manual");
    EXPECT_EQ(store.size(), 1u);
}

TEST(LinkStore, AddReactivatesDeletedLink) {
    testutil::TempDir dir;
    JsonStore store(dir.file("links.json"));
    Link* l = store.add("https://x.y/1");
    const std::string id = l->id;
    ASSERT_TRUE(store.update_status(id, LinkStatus::ToSkip));
    ASSERT_TRUE(store.mark_deleted(id));
    EXPECT_TRUE(store.list_active().empty());

    Link* again = store.add("https://x.y/1", "file", "notes.txt");
    ASSERT_NE(again, nullptr);
    EXPECT_EQ(again->id, id);
    EXPECT_FALSE(again->deleted);
    EXPECT_EQ(again->status, LinkStatus::Pending);
    EXPECT_EQ(again->source, "file");
    EXPECT_EQ(again->source_file, "notes.txt");
    EXPECT_EQ(store.size(), 1u);
}

TEST(LinkStore, UpdateStatusStampsTimes) {
    testutil::TempDir dir;
    JsonStore store(dir.file("links.json"));
    Link* l = store.add("https://x.y/1");
    ASSERT_TRUE(store.update_status(l->id, LinkStatus::Downloading));
    EXPECT_TRUE(l->processed_timestamp.has_value());
    EXPECT_FALSE(l->downloaded_timestamp.has_value());
    ASSERT_TRUE(store.update_status(l->id, LinkStatus::Downloaded));
    EXPECT_TRUE(l->downloaded_timestamp.has_value());
    EXPECT_FALSE(store.update_status("no-such-id", LinkStatus::Error));
}

TEST(LinkStore, QueriesSkipDeletedLinks) {
    testutil::TempDir dir;
    JsonStore store(dir.file("links.json"));
    Link* a = store.add("https://x.y/a");
    Link* b = store.add("https://x.y/b");
    Link* c = store.add("https://x.y/c");
    ASSERT_TRUE(store.update_status(a->id, LinkStatus::ToDownload));
    ASSERT_TRUE(store.update_status(b->id, LinkStatus::ToSkipLimit));
    ASSERT_TRUE(store.update_status(c->id, LinkStatus::ToDownload));
    ASSERT_TRUE(store.mark_deleted(c->id));

    ASSERT_EQ(store.downloadable().size(), 1u);
    EXPECT_EQ(store.downloadable()[0], a);
    ASSERT_EQ(store.limit_skipped().size(), 1u);
    EXPECT_EQ(store.skipped().size(), 1u);
    EXPECT_TRUE(store.pending().empty());
    EXPECT_EQ(store.all().size(), 3u);
}

TEST(LinkStore, PersistsAndReloads) {
    testutil::TempDir dir;
    const std::string path = dir.file("links.json");
    std::string id;
    {
        JsonStore store(path);
        Link* l = store.add("https://x.y/1", "file", "a.txt");
        id = l->id;
        l->images_count = 3;
        ASSERT_TRUE(store.update_status(id, LinkStatus::Downloaded));
    }
    JsonStore reloaded(path);
    ASSERT_TRUE(reloaded.load());
    Link* l = reloaded.get_by_id(id);
    ASSERT_NE(l, nullptr);
    EXPECT_EQ(l->url, "https://x.y/1");
    EXPECT_EQ(l->status, LinkStatus::Downloaded);
    EXPECT_EQ(l->images_count, 3);
    EXPECT_EQ(reloaded.get_by_url("https://x.y/1"), l);
}

TEST(LinkStore, CorruptFileKeepsMemoryStateAndReportsError) {
    testutil::TempDir dir;
    const std::string path = dir.file("links.json");
    testutil::write_file(path, R"([{"url":"https://x.y","status":"bogus"}])");
    JsonStore store(path);
    EXPECT_FALSE(store.load());
    ASSERT_TRUE(store.last_error().has_value());
    EXPECT_EQ(store.last_error()->kind, types::ErrorKind::StoreIO);
    EXPECT_EQ(store.size(), 0u);
}
