#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <sstream>

#include "app/app.hpp"
#include "logger.hpp"
#include "test_util.hpp"

TEST(App, StartupIngestsAndClassifies) {
    testutil::TempDir dir;
    testutil::write_file(dir.file("config.json"), R"({"logging":{"level":"INFO","file":""}})");
    testutil::write_file(dir.file("filters.json"), R"({"next_numeric_id":1,"filters":[
        {"id":"f1","name":"Imgur","action":"to_download",
         "rules":[{"token":"imgur","match_type":"match_exactly","expression":""}]}
    ]})");
    testutil::write_file(dir.file("Link_files/inbox.txt"),
                         "https://imgur.com/a/1\nhttps://example.org/other\n");

    app::App application(dir.path());
    ASSERT_TRUE(application.setup());
    EXPECT_EQ(application.ingest(), 2);
    EXPECT_EQ(application.classify_pending(), 1);

    links::Link* l = application.link_store().get_by_url("https://imgur.com/a/1");
    ASSERT_NE(l, nullptr);
    EXPECT_EQ(l->status, types::LinkStatus::ToDownload);
    EXPECT_EQ(l->filter_id, 1);
    EXPECT_EQ(application.filter_store().list().front().numeric_id, 1);
    EXPECT_TRUE(std::filesystem::exists(dir.file("links.json")));
    logger::set_level(logger::Info);
}

TEST(App, CreatesDefaultConfigAndDataDirectory) {
    testutil::TempDir dir;
    app::App application(dir.path());
    ASSERT_TRUE(application.setup());
    logger::set_log_file("");
    EXPECT_TRUE(std::filesystem::exists(dir.file("config.json")));
    EXPECT_TRUE(std::filesystem::is_directory(dir.file("Link_files")));
    EXPECT_EQ(application.config().gallery_dl.command, "gallery-dl");
}

TEST(App, CorruptLinksFileIsFatal) {
    testutil::TempDir dir;
    testutil::write_file(dir.file("config.json"), R"({"logging":{"file":""}})");
    testutil::write_file(dir.file("links.json"), "[{]");
    app::App application(dir.path());
    EXPECT_FALSE(application.setup());
    EXPECT_EQ(application.run(), 1);
}

TEST(App, ConfirmLimitReadsTheAnswer) {
    download::DecisionChannel::Request req;
    req.url = "https://imgur.com/a/big";
    req.kind = types::LimitKind::ImageCount;
    std::atomic<bool> interrupted{false};

    std::istringstream yes("y\n");
    std::ostringstream prompt;
    EXPECT_TRUE(app::confirm_limit(yes, prompt, req, interrupted));
    EXPECT_NE(prompt.str().find("https://imgur.com/a/big"), std::string::npos);
    EXPECT_NE(prompt.str().find("[y/N]"), std::string::npos);

    std::istringstream no("n\n");
    std::ostringstream ignored;
    EXPECT_FALSE(app::confirm_limit(no, ignored, req, interrupted));
    std::istringstream eof("");
    EXPECT_FALSE(app::confirm_limit(eof, ignored, req, interrupted));
}

TEST(App, ConfirmLimitSkipsWithoutPromptingOnceInterrupted) {
    download::DecisionChannel::Request req;
    req.url = "https://imgur.com/a/slow";
    std::atomic<bool> interrupted{true};

    std::istringstream in("y\n");
    std::ostringstream out;
    EXPECT_FALSE(app::confirm_limit(in, out, req, interrupted));
    EXPECT_TRUE(out.str().empty());
    std::string unread;
    EXPECT_TRUE(static_cast<bool>(std::getline(in, unread)));
    EXPECT_EQ(unread, "y");
}
