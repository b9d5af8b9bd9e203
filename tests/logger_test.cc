#include "test_util.h"
#include <core/util/logger.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

using namespace landrop;
using landrop::test::ReadFile;
using landrop::test::TempDir;

namespace {

std::vector<std::filesystem::path> LogFiles(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().rfind("landrop_", 0) == 0) {
            files.push_back(entry.path());
        }
    }
    return files;
}

} // namespace

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(core::ParseLogLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(core::ParseLogLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(core::ParseLogLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(core::ParseLogLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(core::ParseLogLevel("Error"), spdlog::level::err);
    EXPECT_EQ(core::ParseLogLevel("off"), spdlog::level::off);
    EXPECT_FALSE(core::ParseLogLevel("loud").has_value());
    EXPECT_FALSE(core::ParseLogLevel("").has_value());
}

TEST(LoggerTest, WritesDailyFileAndRestoresDefault) {
    TempDir dir;
    auto previous = spdlog::default_logger();
    {
        core::LogOptions options;
        options.directory = dir / "logs";
        options.console = false;
        options.level = spdlog::level::info;
        core::LogSession session(options);

        EXPECT_EQ(session.file_base(), dir / "logs" / "landrop.log");
        EXPECT_EQ(spdlog::default_logger()->name(), "landrop");
        spdlog::info("kept line {}", 1);
        spdlog::debug("filtered line");
        session.SetLevel(spdlog::level::debug);
        EXPECT_EQ(session.level(), spdlog::level::debug);
        spdlog::debug("kept line {}", 2);
    }
    EXPECT_EQ(spdlog::default_logger(), previous);
    EXPECT_EQ(spdlog::get("landrop"), nullptr);

    auto files = LogFiles(dir / "logs");
    ASSERT_EQ(files.size(), 1u);
    auto text = ReadFile(files.front());
    EXPECT_NE(text.find("landrop log opened"), std::string::npos);
    EXPECT_NE(text.find("kept line 1"), std::string::npos);
    EXPECT_NE(text.find("kept line 2"), std::string::npos);
    EXPECT_EQ(text.find("filtered line"), std::string::npos);
    EXPECT_NE(text.find("landrop log closed"), std::string::npos);
}

TEST(LoggerTest, UnusableDirectoryFallsBackToConsole) {
    TempDir dir;
    test::WriteFile(dir / "occupied", "not a directory");
    core::LogOptions options;
    options.directory = dir / "occupied";
    core::LogSession session(options);
    EXPECT_TRUE(session.file_base().empty());
    spdlog::info("console only");
    session.Flush();
}
