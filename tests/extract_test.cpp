#include <gtest/gtest.h>

#include "links/extract.hpp"
#include "test_util.hpp"

using links::extract_urls;

TEST(ExtractUrls, FindsUrlsAndStripsTrailingPunctuation) {
    const std::string text =
        "See https://imgur.com/a/abc, and also http://example.com/x?y=1.\n"
        "Not a url: ftp://nope. Quoted \"https://q.example/z\"!";
    const std::vector<std::string> expected{
        "https://imgur.com/a/abc", "http://example.com/x?y=1", "https://q.example/z"};
    EXPECT_EQ(extract_urls(text), expected);
}

TEST(ExtractUrls, StopsAtBracketsAndWhitespace) {
    const std::vector<std::string> expected{"https://a.b/c"};
    EXPECT_EQ(extract_urls("[https://a.b/c]"), expected);
    EXPECT_TRUE(extract_urls("no links here").empty());
}

TEST(AddLinksFromText, AddsEachUrlOnce) {
    testutil::TempDir dir;
    links::JsonStore store(dir.file("links.json"));
    auto added = links::add_links_from_text(store, "https://x.y/1 https://x.y/2 https://x.y/1", "clipboard");
    EXPECT_EQ(added.size(), 3u);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.get_by_url("https://x.y/2")->source, "clipboard");
}

TEST(IngestDirectory, ReadsPlainTextFilesRecursively) {
    testutil::TempDir dir;
    testutil::write_file(dir.file("in/a.txt"), "https://x.y/a\n");
    testutil::write_file(dir.file("in/sub/b.md"), "- https://x.y/b\n");
    testutil::write_file(dir.file("in/c.bin"), "https://x.y/c\n");

    links::JsonStore store(dir.file("links.json"));
    auto added = links::ingest_directory(store, dir.file("in"));
    ASSERT_EQ(added.size(), 2u);
    EXPECT_EQ(store.get_by_url("https://x.y/c"), nullptr);
    links::Link* a = store.get_by_url("https://x.y/a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->source, "file");
    EXPECT_EQ(a->source_file, dir.file("in/a.txt"));
}

TEST(IngestDirectory, MissingDirectoryAddsNothing) {
    testutil::TempDir dir;
    links::JsonStore store(dir.file("links.json"));
    EXPECT_TRUE(links::ingest_directory(store, dir.file("absent")).empty());
}
