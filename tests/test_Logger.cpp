/**
 * Logger 单元测试: 回调收到的级别、debug 开关、日志文件格式,
 * 以及编辑成功 / 越界访问各自落在哪个级别。
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/Errors.h"
#include "edit/EditEngine.h"
#include "sandbox/BoundarySet.h"
#include "sandbox/PathResolver.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

static std::string readAll(const fs::path& p) {
  std::string s;
  std::ifstream f(p, std::ios::binary);
  if (f) s.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  return s;
}

class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    root = fs::temp_directory_path() / "warden_logger_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root / "work");
    root = fs::canonical(root);

    Logger& log = Logger::getInstance();
    log.setLogFile("");
    log.setConsoleEnabled(false);
    log.setDebugEnabled(false);
    log.setCallback([this](LogLevel level, const std::string& message) {
      records.emplace_back(level, message);
    });
  }

  void TearDown() override {
    Logger& log = Logger::getInstance();
    log.setCallback(nullptr);
    log.setConsoleEnabled(true);
    log.setDebugEnabled(false);
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  bool logged(LogLevel level, const std::string& fragment) const {
    for (const auto& r : records) {
      if (r.first == level && r.second.find(fragment) != std::string::npos) return true;
    }
    return false;
  }

  fs::path root;
  std::vector<std::pair<LogLevel, std::string>> records;
};

TEST_F(LoggerTest, DebugMessagesNeedDebugEnabled) {
  Logger::getInstance().debug("hidden detail");
  EXPECT_TRUE(records.empty());

  Logger::getInstance().setDebugEnabled(true);
  Logger::getInstance().debug("visible detail");
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].first, LogLevel::DEBUG);
  EXPECT_EQ(records[0].second, "visible detail");
}

TEST_F(LoggerTest, LogFileLinesCarryTimestampAndLevel) {
  fs::path file = root / "warden.log";
  Logger::getInstance().setLogFile(file.string());
  Logger::getInstance().info("first line\n");
  Logger::getInstance().warn("second line");
  Logger::getInstance().setLogFile("");

  std::string text = readAll(file);
  EXPECT_EQ(text.rfind("[", 0), 0u) << text;
  EXPECT_NE(text.find("] [INFO] first line\n"), std::string::npos) << text;
  EXPECT_NE(text.find("] [WARN] second line\n"), std::string::npos) << text;
}

TEST_F(LoggerTest, WrittenEditIsLoggedAsSuccess) {
  fs::path file = root / "work" / "a.txt";
  {
    std::ofstream f(file, std::ios::binary);
    f << "hello\n";
  }
  EditEngine::applyToFile(file, {{"hello", "hi"}}, false);
  EXPECT_TRUE(logged(LogLevel::SUCCESS, "Edited " + file.string()));

  records.clear();
  EditEngine::applyToFile(file, {{"hi", "hey"}}, true);
  EXPECT_FALSE(logged(LogLevel::SUCCESS, "Edited"));
}

TEST_F(LoggerTest, AccessDenialIsLoggedAsWarning) {
  PathResolver resolver(std::make_shared<const BoundarySet>(
      BoundarySet::fromWorkingDirectory((root / "work").string())));
  EXPECT_THROW(resolver.resolve("../elsewhere.txt"), AccessDenied);
  EXPECT_TRUE(logged(LogLevel::WARNING, "Access denied")) << records.size();
}
