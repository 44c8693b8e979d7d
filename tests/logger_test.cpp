#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "test_utils.hpp"
#include "utils/logger.hpp"

namespace utils {
namespace {

TEST(LogLevelTest, ParsesNames) {
  EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::DEBUG);
  EXPECT_EQ(ParseLogLevel("info"), LogLevel::INFO);
  EXPECT_EQ(ParseLogLevel("Warn"), LogLevel::WARN);
  EXPECT_EQ(ParseLogLevel("warning"), LogLevel::WARN);
  EXPECT_EQ(ParseLogLevel("ERROR"), LogLevel::ERROR);
  EXPECT_EQ(ParseLogLevel("fatal"), LogLevel::FATAL);
  EXPECT_EQ(ParseLogLevel("verbose"), LogLevel::INFO);
  EXPECT_EQ(ParseLogLevel("", LogLevel::ERROR), LogLevel::ERROR);
}

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    LogConfig config;
    config.logFilePath = dir_.str();
    config.logFileName = "test.log";
    config.minLevel = LogLevel::INFO;
    config.toConsole = false;
    Logger::initialize(config);
  }

  std::string logContent() const {
    return testutil::ReadFile((dir_.path() / "test.log").string());
  }

  testutil::TempDir dir_;
};

TEST_F(LoggerTest, WritesFormattedLine) {
  LOG(INFO) << "capture " << 42 << " started";
  std::string content = logContent();
  EXPECT_NE(content.find("[INFO]"), std::string::npos);
  EXPECT_NE(content.find("capture 42 started"), std::string::npos);
  EXPECT_NE(content.find("logger_test.cpp:"), std::string::npos);
  // 只输出文件名，不带目录
  EXPECT_EQ(content.find("/logger_test.cpp"), std::string::npos);
}

TEST_F(LoggerTest, DropsMessagesBelowMinLevel) {
  LOG(DEBUG) << "hidden detail";
  LOG(WARN) << "visible warning";
  std::string content = logContent();
  EXPECT_EQ(content.find("hidden detail"), std::string::npos);
  EXPECT_NE(content.find("visible warning"), std::string::npos);

  LogConfig verbose;
  verbose.logFilePath = dir_.str();
  verbose.logFileName = "test.log";
  verbose.minLevel = LogLevel::DEBUG;
  verbose.toConsole = false;
  Logger::initialize(verbose);
  EXPECT_TRUE(Logger::isEnabled(LogLevel::DEBUG));
  LOG(DEBUG) << "now shown";
  EXPECT_NE(logContent().find("now shown"), std::string::npos);
}

TEST_F(LoggerTest, RotatesWhenFileIsFull) {
  LogConfig config;
  config.logFilePath = dir_.str();
  config.logFileName = "test.log";
  config.maxFileSize = 256;
  config.maxBackupFiles = 2;
  config.toConsole = false;
  Logger::initialize(config);

  for (int i = 0; i < 20; ++i) {
    LOG(INFO) << "line " << i << " " << std::string(40, 'x');
  }
  EXPECT_TRUE(std::filesystem::exists(dir_.path() / "test.log.1"));
  EXPECT_FALSE(std::filesystem::exists(dir_.path() / "test.log.3"));
  EXPECT_NE(logContent().find("line 19"), std::string::npos);
}

}  // namespace
}  // namespace utils
