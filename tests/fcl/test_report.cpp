#include <gtest/gtest.h>
#include <fcl/report.hpp>

#include <nlohmann/json.hpp>

using namespace fcl;

TEST(HumanReadableSizeTest, Units) {
    EXPECT_EQ(human_readable_size(0), "0 B");
    EXPECT_EQ(human_readable_size(512), "512.00 B");
    EXPECT_EQ(human_readable_size(1024), "1.00 KB");
    EXPECT_EQ(human_readable_size(1536), "1.50 KB");
    EXPECT_EQ(human_readable_size(5ull * 1024 * 1024), "5.00 MB");
    EXPECT_EQ(human_readable_size(3ull * 1024 * 1024 * 1024 * 1024), "3.00 TB");
}

class ReportRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        stats_.directory = "/data/inbox";
        stats_.add("images", "tiny", "today", 100);
        stats_.add("images", "tiny", "older", 200);
        stats_.add("audio", "huge", "today", 5000);
        stats_.add("text", "tiny", "this_week", 10);
        stats_.add("archives", "tiny", "today", 1);
    }

    ReportRenderer renderer_{{"tiny", "small", "huge"},
                             {"today", "this_week", "this_month", "this_year", "older"}};
    ReportStats stats_;
};

TEST_F(ReportRendererTest, TotalsAccumulate) {
    EXPECT_EQ(stats_.total_files, 5u);
    EXPECT_EQ(stats_.total_size, 5311u);
    EXPECT_EQ(stats_.by_type.at("images").count, 2u);
    EXPECT_EQ(stats_.by_type.at("images").size, 300u);
}

TEST_F(ReportRendererTest, TypesByDescendingCountThenName) {
    auto rows = ReportRenderer::by_count(stats_.by_type);
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0].first, "images");
    EXPECT_EQ(rows[1].first, "archives");
    EXPECT_EQ(rows[2].first, "audio");
    EXPECT_EQ(rows[3].first, "text");
}

TEST_F(ReportRendererTest, CanonicalOrderWithUnknownLabelsLast) {
    std::map<std::string, CategoryStats> buckets;
    buckets["huge"] = {1, 10};
    buckets["tiny"] = {2, 4};
    buckets["custom"] = {1, 1};
    buckets["small"] = {0, 0};

    auto rows = ReportRenderer::in_order(buckets, {"tiny", "small", "huge"});
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].first, "tiny");
    EXPECT_EQ(rows[1].first, "huge");
    EXPECT_EQ(rows[2].first, "custom");
}

TEST_F(ReportRendererTest, TextLayout) {
    std::string text = renderer_.render_text(stats_, false);

    EXPECT_EQ(text.rfind("Report for /data/inbox\nTotal files: 5\nTotal size: 5311 bytes\n", 0), 0u);
    EXPECT_NE(text.find("\nBy type:\n  images: 2 files, 300 bytes\n"), std::string::npos);
    EXPECT_NE(text.find("  audio: 1 file, 5000 bytes\n"), std::string::npos);
    EXPECT_NE(text.find("\nBy size:\n  tiny: 4 files, 311 bytes\n  huge: 1 file, 5000 bytes\n"),
              std::string::npos);
    EXPECT_NE(text.find("\nBy date:\n  today: 3 files"), std::string::npos);
    EXPECT_EQ(text.find("small"), std::string::npos);
    EXPECT_EQ(text.find("this_month"), std::string::npos);
}

TEST_F(ReportRendererTest, HumanReadableText) {
    std::string text = renderer_.render_text(stats_, true);
    EXPECT_NE(text.find("Total size: 5.19 KB\n"), std::string::npos);
}

TEST_F(ReportRendererTest, JsonMatchesText) {
    auto j = nlohmann::ordered_json::parse(renderer_.render_json(stats_, true));

    EXPECT_EQ(j["directory"], "/data/inbox");
    EXPECT_EQ(j["total_files"].get<uint64_t>(), 5u);
    EXPECT_EQ(j["total_size"].get<uint64_t>(), 5311u);
    EXPECT_EQ(j["total_size_human"], "5.19 KB");

    EXPECT_EQ(j["by_type"].begin().key(), "images");
    EXPECT_EQ(j["by_type"]["images"]["size_human"], "300.00 B");
    EXPECT_FALSE(j["by_size"].contains("small"));
    EXPECT_EQ(j["by_date"]["older"]["count"].get<uint64_t>(), 1u);
}

TEST_F(ReportRendererTest, JsonWithoutHumanSizes) {
    auto j = nlohmann::json::parse(renderer_.render_json(stats_, false));
    EXPECT_FALSE(j.contains("total_size_human"));
    EXPECT_FALSE(j["by_type"]["audio"].contains("size_human"));
}

TEST(ReportEmptyTest, EmptyDirectoryReport) {
    ReportStats stats;
    stats.directory = "/empty";
    ReportRenderer renderer({"tiny"}, {"today"});

    auto j = nlohmann::json::parse(renderer.render_json(stats, true));
    EXPECT_EQ(j["total_files"].get<uint64_t>(), 0u);
    EXPECT_EQ(j["total_size_human"], "0 B");
    EXPECT_TRUE(j["by_type"].empty());
}
