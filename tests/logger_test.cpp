#include <gtest/gtest.h>

#include <filesystem>

#include "logger.hpp"
#include "test_util.hpp"

namespace {
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { logger::clear(); }
    void TearDown() override {
        logger::set_log_file("");
        logger::set_level(logger::Info);
        logger::clear();
    }
};
} // namespace

TEST_F(LoggerTest, LevelFiltersLines) {
    logger::set_level(logger::Warn);
    logger::info("quiet");
    logger::warn("loud");
    logger::error("louder");
    const auto lines = logger::lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("[WARN]"), std::string::npos);
    EXPECT_NE(lines[0].find("loud"), std::string::npos);
    EXPECT_NE(lines[1].find("[ERROR]"), std::string::npos);
}

TEST_F(LoggerTest, LevelNames) {
    logger::set_level_name("debug");
    EXPECT_EQ(logger::level(), logger::Debug);
    logger::set_level_name("WARNING");
    EXPECT_EQ(logger::level(), logger::Warn);
    logger::set_level_name("nonsense");
    EXPECT_EQ(logger::level(), logger::Info);
}

TEST_F(LoggerTest, BufferKeepsTheLastLines) {
    for (int i = 0; i < 2100; ++i) logger::error("line " + std::to_string(i));
    EXPECT_EQ(logger::line_count(), 2000u);
    EXPECT_NE(logger::lines().back().find("line 2099"), std::string::npos);
}

TEST_F(LoggerTest, FileRotation) {
    testutil::TempDir dir;
    const std::string path = dir.file("logs/app.log");
    logger::set_log_file(path, 256, 2);
    for (int i = 0; i < 40; ++i) logger::info("rotating log line number " + std::to_string(i));
    logger::set_log_file("");

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_TRUE(std::filesystem::exists(path + ".1"));
    EXPECT_TRUE(std::filesystem::exists(path + ".2"));
    EXPECT_FALSE(std::filesystem::exists(path + ".3"));
    EXPECT_LE(std::filesystem::file_size(path), 256u);
}
