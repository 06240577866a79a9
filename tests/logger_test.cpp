#include "humio_exporter/common/logger.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace humio_exporter {
namespace common {

TEST(Logger, silent_until_initialized) {
    auto& logger = Logger::instance();
    EXPECT_FALSE(logger.isInitialized());
    logger.info("[Test] Dropped | value={}", 1);
    logger.flush();
}

TEST(Logger, writes_to_file) {
    auto dir = std::filesystem::temp_directory_path() /
               ("humio_exporter_logger_" + std::to_string(getpid()));
    auto log_file = (dir / "exporter.log").string();

    auto& logger = Logger::instance();
    logger.initialize(LogMode::FILE_ONLY, log_file, LogLevel::DEBUG, createDefaultLoggingConfig());
    ASSERT_TRUE(logger.isInitialized());

    logger.info("[Test] Written | endpoint={}", "https://cloud.example.com");
    logger.debug("[Test] Debug line");
    logger.flush();

    std::ifstream file(log_file);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_NE(content.str().find("[Test] Written | endpoint=https://cloud.example.com"), std::string::npos);
    EXPECT_NE(content.str().find("[Test] Debug line"), std::string::npos);

    logger.shutdown();
    EXPECT_FALSE(logger.isInitialized());

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(Logger, file_mode_without_path_uses_console) {
    auto& logger = Logger::instance();
    EXPECT_NO_THROW(logger.initialize(LogMode::FILE_ONLY, "", LogLevel::ERROR, createDefaultLoggingConfig()));
    EXPECT_TRUE(logger.isInitialized());
    logger.error("[Test] Console fallback");
    logger.shutdown();
    EXPECT_FALSE(logger.isInitialized());
}

TEST(Logger, parse_log_level) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("ERROR", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

}}
