#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "core/logging/logger.hpp"
#include "support/temp_path.hpp"

namespace {

using cortex::core::logging::FileRotation;
using cortex::core::logging::Logger;
using cortex::core::logging::LogLevel;
using cortex::core::logging::make_invocation_tag;

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

class LogDir {
public:
    LogDir() : root_(cortex::testing::unique_temp_path("cortex_log_")) {
        std::filesystem::create_directories(root_);
    }

    ~LogDir() {
        Logger::get().close_file();
        Logger::get().set_min_level(LogLevel::INFO);
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path file() const { return root_ / "debug.log"; }

private:
    std::filesystem::path root_;
};

TEST(LoggerTest, InvocationTagHasPrefixAndEightHexDigits) {
    const std::string tag = make_invocation_tag();
    ASSERT_EQ(tag.size(), 12U);
    EXPECT_EQ(tag.substr(0, 4), "orc-");
    EXPECT_EQ(tag.find_first_not_of("0123456789abcdef", 4), std::string::npos);
}

TEST(LoggerTest, FileKeepsDebugRecordsBelowConsoleLevel) {
    LogDir dir;
    Logger::get().set_min_level(LogLevel::WARN);
    ASSERT_TRUE(Logger::get().open_file(dir.file()));
    const std::string tag = Logger::get().begin_invocation();

    LOG_DEBUG("probing claude --version");
    Logger::get().close_file();

    const std::string content = read_file(dir.file());
    EXPECT_NE(content.find("[DEBUG] cortex: [" + tag + "] probing claude --version"),
              std::string::npos);
}

TEST(LoggerTest, RotatesWhenFileExceedsLimit) {
    LogDir dir;
    FileRotation rotation;
    rotation.max_bytes = 200;
    rotation.backups = 2;
    ASSERT_TRUE(Logger::get().open_file(dir.file(), rotation));
    Logger::get().set_min_level(LogLevel::ERROR);

    for (int i = 0; i < 20; ++i) {
        LOG_INFO("record number " + std::to_string(i) + " with some padding text");
    }
    Logger::get().close_file();

    const std::string base = dir.file().string();
    EXPECT_TRUE(std::filesystem::exists(base + ".1"));
    EXPECT_TRUE(std::filesystem::exists(base + ".2"));
    EXPECT_FALSE(std::filesystem::exists(base + ".3"));
    EXPECT_LT(std::filesystem::file_size(dir.file()), 200U);
}

}  // namespace
