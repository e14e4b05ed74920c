#include <gtest/gtest.h>

#include "classify/classifier.hpp"
#include "test_util.hpp"

using classify::Classifier;
using filters::Filter;
using types::FilterAction;
using types::LinkStatus;
using types::MatchType;

namespace {
Filter host_filter(const std::string& name, const std::string& host, FilterAction action, int priority = 0) {
    Filter f;
    f.name = name;
    f.action = action;
    f.priority = priority;
    filters::Rule r;
    r.match_type = MatchType::Exact;
    r.expression = host;
    f.rules.push_back(r);
    return f;
}

class ClassifierTest : public ::testing::Test {
protected:
    ClassifierTest()
        : links_(dir_.file("links.json")), filters_(dir_.file("filters.json")) {}

    void SetUp() override {
        ASSERT_TRUE(filters_.add(host_filter("grab", "imgur", FilterAction::Download)));
        ASSERT_TRUE(filters_.add(host_filter("ignore", "reddit", FilterAction::Skip)));
        ASSERT_TRUE(filters_.add(host_filter("drop", "ads", FilterAction::Delete)));
    }

    testutil::TempDir dir_;
    links::JsonStore links_;
    filters::JsonStore filters_;
};
} // namespace

TEST_F(ClassifierTest, AppliesFilterActions) {
    links::Link* grab = links_.add("https://imgur.com/a/1");
    links::Link* skip = links_.add("https://reddit.com/r/x");
    links::Link* drop = links_.add("https://ads.example/banner");
    links::Link* none = links_.add("https://example.org/");

    Classifier classifier(links_, filters_);
    auto unmatched = classifier.process_pending();

    ASSERT_EQ(unmatched.size(), 1u);
    EXPECT_EQ(unmatched[0], none);
    EXPECT_EQ(grab->status, LinkStatus::ToDownload);
    EXPECT_EQ(grab->filter_matched, "grab");
    EXPECT_EQ(grab->filter_id, 1);
    EXPECT_TRUE(grab->processed_timestamp.has_value());
    EXPECT_EQ(skip->status, LinkStatus::ToSkip);
    EXPECT_TRUE(drop->deleted);
    EXPECT_EQ(drop->status, LinkStatus::Pending);
    EXPECT_EQ(none->status, LinkStatus::Pending);
}

TEST_F(ClassifierTest, ReprocessAllLeavesDownloadsAlone) {
    links::Link* done = links_.add("https://imgur.com/done");
    links::Link* running = links_.add("https://imgur.com/running");
    links::Link* failed = links_.add("https://reddit.com/failed");
    ASSERT_TRUE(links_.update_status(done->id, LinkStatus::Downloaded));
    ASSERT_TRUE(links_.update_status(running->id, LinkStatus::Downloading));
    ASSERT_TRUE(links_.update_status(failed->id, LinkStatus::Error));

    Classifier classifier(links_, filters_);
    EXPECT_EQ(classifier.reprocess_all(), 1);
    EXPECT_EQ(done->status, LinkStatus::Downloaded);
    EXPECT_EQ(running->status, LinkStatus::Downloading);
    EXPECT_EQ(failed->status, LinkStatus::ToSkip);
}

TEST_F(ClassifierTest, RequestReprocessThenClassify) {
    links::Link* l = links_.add("https://imgur.com/x");
    ASSERT_TRUE(links_.update_status(l->id, LinkStatus::Skipped));

    Classifier classifier(links_, filters_);
    ASSERT_TRUE(classifier.request_reprocess(l->id));
    EXPECT_EQ(l->status, LinkStatus::ToReprocess);
    EXPECT_TRUE(classifier.process_pending().empty());
    EXPECT_EQ(l->status, LinkStatus::ToDownload);

    ASSERT_TRUE(links_.mark_deleted(l->id));
    EXPECT_FALSE(classifier.request_reprocess(l->id));
    EXPECT_FALSE(classifier.request_reprocess("missing"));
}

TEST_F(ClassifierTest, TrimsTrailingClosersWhenEnabled) {
    links::Link* l = links_.add("https://imgur.com/a/1)");
    classify::Options opts;
    opts.trim_trailing_closers = true;
    Classifier classifier(links_, filters_, opts);
    EXPECT_TRUE(classifier.process(*l));
    EXPECT_EQ(l->url, "https://imgur.com/a/1");
    EXPECT_EQ(l->status, LinkStatus::ToDownload);
}

TEST_F(ClassifierTest, TrimmedDuplicateOfActiveLinkIsRemoved) {
    links::Link* kept = links_.add("https://imgur.com/a");
    links::Link* dup = links_.add("https://imgur.com/a)");
    classify::Options opts;
    opts.trim_trailing_closers = true;
    Classifier classifier(links_, filters_, opts);

    EXPECT_TRUE(classifier.process_pending().empty());

    int active_with_url = 0;
    for (const auto* l : links_.list_active()) {
        if (l->url == "https://imgur.com/a") ++active_with_url;
    }
    EXPECT_EQ(active_with_url, 1);
    EXPECT_EQ(kept->status, LinkStatus::ToDownload);
    EXPECT_TRUE(dup->deleted);
    EXPECT_EQ(dup->url, "https://imgur.com/a)");
}

TEST(TrimTrailingClosers, NeverTrimsToEmpty) {
    EXPECT_EQ(classify::trim_trailing_closers("https://x.y/a)]}'\""), "https://x.y/a");
    EXPECT_EQ(classify::trim_trailing_closers("))"), "))");
}
