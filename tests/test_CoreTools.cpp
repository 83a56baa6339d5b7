/**
 * 文件工具与命令工具的集成测试: 通过 ToolRegistry 调用, 在临时边界目录下验证
 * 成功路径以及越界访问被拒绝 (错误结果而不是异常)。
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "core/ConfigManager.h"
#include "process/ProcessRunner.h"
#include "sandbox/BoundarySet.h"
#include "sandbox/PathResolver.h"
#include "tools/CoreTools.h"
#include "tools/ToolRegistry.h"

namespace fs = std::filesystem;

static void createFile(const fs::path& p, const std::string& content) {
  std::ofstream f(p);
  ASSERT_TRUE(f.is_open()) << "create " << p.u8string();
  f << content;
}

static std::string readAll(const fs::path& p) {
  std::string s;
  std::ifstream f(p);
  if (f) s.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  return s;
}

static std::string textOf(const nlohmann::json& res) {
  return res["content"][0]["text"].get<std::string>();
}

class CoreToolsTest : public ::testing::Test {
protected:
  void SetUp() override {
    fs::path tmp = fs::temp_directory_path() / "warden_core_tools_test";
    std::error_code ec;
    fs::remove_all(tmp, ec);
    fs::create_directories(tmp / "work" / "src");
    fs::create_directories(tmp / "outside");
    base = fs::canonical(tmp);
    work = base / "work";
    outside = base / "outside";
    createFile(work / "a.txt", "hello\n");
    createFile(work / "src" / "main.cpp", "int main() { return 0; }\n");
    createFile(outside / "secret.txt", "secret\n");

    Config cfg;
    cfg.process.defaultTimeoutMs = 5000;
    auto boundaries = std::make_shared<const BoundarySet>(BoundarySet::fromWorkingDirectory(work.string()));
    registerBuiltinTools(registry, std::make_shared<const PathResolver>(boundaries),
                         std::make_shared<ProcessRunner>(std::chrono::milliseconds(200)), cfg);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(base, ec);
  }

  fs::path base;
  fs::path work;
  fs::path outside;
  ToolRegistry registry;
};

TEST_F(CoreToolsTest, RegistersAllBuiltinTools) {
  for (const char* name : {"read_file", "list_directory", "search_files", "edit_file", "delete_file",
                           "codebase_search", "grep_search", "run_terminal_command", "list_allowed_directories"}) {
    EXPECT_TRUE(registry.hasTool(name)) << name;
  }
  EXPECT_EQ(registry.getToolCount(), 9u);
}

TEST_F(CoreToolsTest, ReadFileReturnsContent) {
  auto res = registry.executeTool("read_file", {{"path", "a.txt"}});
  ASSERT_FALSE(ToolRegistry::isError(res)) << res.dump(2);
  EXPECT_EQ(textOf(res), "hello\n");
}

TEST_F(CoreToolsTest, ReadFileOutsideIsAccessDenied) {
  auto res = registry.executeTool("read_file", {{"path", (outside / "secret.txt").string()}});
  EXPECT_TRUE(ToolRegistry::isError(res));
  EXPECT_EQ(res["error_type"], "access_denied");
  EXPECT_EQ(textOf(res).find("secret\n"), std::string::npos);
}

TEST_F(CoreToolsTest, ReadMissingFileIsNotFound) {
  auto res = registry.executeTool("read_file", {{"path", "nope.txt"}});
  EXPECT_EQ(res["error_type"], "not_found");
}

TEST_F(CoreToolsTest, ListDirectoryMarksEntries) {
  auto res = registry.executeTool("list_directory", {{"path", "."}});
  ASSERT_FALSE(ToolRegistry::isError(res)) << res.dump(2);
  EXPECT_EQ(textOf(res), "[FILE] a.txt\n[DIR] src");
  ASSERT_EQ(res["entries"].size(), 2u);
  EXPECT_EQ(res["entries"][1]["type"], "directory");
}

TEST_F(CoreToolsTest, ListDirectoryOutsideIsDenied) {
  auto res = registry.executeTool("list_directory", {{"path", "../outside"}});
  EXPECT_EQ(res["error_type"], "access_denied");
}

TEST_F(CoreToolsTest, SearchFilesMatchesNameSubstring) {
  createFile(work / "src" / "helper_test.cpp", "");
  auto res = registry.executeTool("search_files", {{"path", "."}, {"pattern", "main"}});
  ASSERT_FALSE(ToolRegistry::isError(res)) << res.dump(2);
  ASSERT_EQ(res["matches"].size(), 1u) << res.dump(2);
  EXPECT_EQ(fs::path(res["matches"][0].get<std::string>()).filename(), "main.cpp");

  auto excluded = registry.executeTool("search_files",
      {{"path", "."}, {"pattern", ".cpp"}, {"excludePatterns", {"helper"}}});
  ASSERT_FALSE(ToolRegistry::isError(excluded)) << excluded.dump(2);
  EXPECT_EQ(excluded["matches"].size(), 1u) << excluded.dump(2);

  auto none = registry.executeTool("search_files", {{"path", "."}, {"pattern", "zzz_no_match"}});
  EXPECT_EQ(textOf(none), "No matches found");
}

TEST_F(CoreToolsTest, EditFileHelloToHi) {
  auto res = registry.executeTool("edit_file", {
    {"path", "a.txt"},
    {"edits", {{{"oldText", "hello"}, {"newText", "hi"}}}}
  });
  ASSERT_FALSE(ToolRegistry::isError(res)) << res.dump(2);
  EXPECT_EQ(readAll(work / "a.txt"), "hi\n");
  EXPECT_NE(textOf(res).find("-hello"), std::string::npos) << textOf(res);
  EXPECT_NE(textOf(res).find("+hi"), std::string::npos) << textOf(res);
}

TEST_F(CoreToolsTest, EditFileDryRunDoesNotWrite) {
  auto res = registry.executeTool("edit_file", {
    {"path", "a.txt"},
    {"edits", {{{"oldText", "hello"}, {"newText", "hi"}}}},
    {"dryRun", true}
  });
  ASSERT_FALSE(ToolRegistry::isError(res)) << res.dump(2);
  EXPECT_EQ(readAll(work / "a.txt"), "hello\n");
  EXPECT_TRUE(res["dry_run"].get<bool>());
}

TEST_F(CoreToolsTest, EditFileConflictIsReported) {
  auto res = registry.executeTool("edit_file", {
    {"path", "a.txt"},
    {"edits", {{{"oldText", "goodbye"}, {"newText", "hi"}}}}
  });
  EXPECT_EQ(res["error_type"], "edit_conflict");
  EXPECT_EQ(readAll(work / "a.txt"), "hello\n");
}

TEST_F(CoreToolsTest, EditFileThroughEscapingSymlinkIsDenied) {
  fs::create_symlink(outside / "secret.txt", work / "link.txt");
  auto res = registry.executeTool("edit_file", {
    {"path", "link.txt"},
    {"edits", {{{"oldText", "secret"}, {"newText", "leaked"}}}}
  });
  EXPECT_EQ(res["error_type"], "access_denied");
  EXPECT_EQ(readAll(outside / "secret.txt"), "secret\n");
}

TEST_F(CoreToolsTest, DeleteFileRemovesFileOnly) {
  auto res = registry.executeTool("delete_file", {{"path", "a.txt"}});
  ASSERT_FALSE(ToolRegistry::isError(res)) << res.dump(2);
  EXPECT_FALSE(fs::exists(work / "a.txt"));
  EXPECT_EQ(textOf(res), "Successfully deleted file a.txt");

  auto dir = registry.executeTool("delete_file", {{"path", "src"}});
  EXPECT_EQ(dir["error_type"], "invalid_arguments");
  EXPECT_TRUE(fs::exists(work / "src"));
}

TEST_F(CoreToolsTest, DeleteSymlinkKeepsTarget) {
  fs::create_symlink(work / "a.txt", work / "alias.txt");
  auto res = registry.executeTool("delete_file", {{"path", "alias.txt"}});
  ASSERT_FALSE(ToolRegistry::isError(res)) << res.dump(2);
  EXPECT_FALSE(fs::is_symlink(fs::symlink_status(work / "alias.txt")));
  EXPECT_TRUE(fs::exists(work / "a.txt"));
}

TEST_F(CoreToolsTest, DeleteOutsideIsDenied) {
  auto res = registry.executeTool("delete_file", {{"path", (outside / "secret.txt").string()}});
  EXPECT_EQ(res["error_type"], "access_denied");
  EXPECT_TRUE(fs::exists(outside / "secret.txt"));
}

TEST_F(CoreToolsTest, RunCommandInBaseDirectory) {
  auto res = registry.executeTool("run_terminal_command", {{"command", "pwd"}});
  ASSERT_FALSE(ToolRegistry::isError(res)) << res.dump(2);
  EXPECT_EQ(textOf(res), work.string() + "\n");
  EXPECT_EQ(res["exit_code"], 0);
}

TEST_F(CoreToolsTest, RunCommandWithWorkingDirectory) {
  auto res = registry.executeTool("run_terminal_command", {{"command", "ls"}, {"workingDirectory", "src"}});
  ASSERT_FALSE(ToolRegistry::isError(res)) << res.dump(2);
  EXPECT_EQ(textOf(res), "main.cpp\n");

  auto denied = registry.executeTool("run_terminal_command",
      {{"command", "ls"}, {"workingDirectory", outside.string()}});
  EXPECT_EQ(denied["error_type"], "access_denied");
}

TEST_F(CoreToolsTest, RunCommandReportsFailureWithOutput) {
  auto res = registry.executeTool("run_terminal_command", {{"command", "echo out; echo err >&2; exit 4"}});
  EXPECT_EQ(res["error_type"], "execution_failure");
  std::string message = res["error"].get<std::string>();
  EXPECT_NE(message.find("exit code 4"), std::string::npos) << message;
  EXPECT_NE(message.find("out"), std::string::npos) << message;
  EXPECT_NE(message.find("STDERR:\nerr"), std::string::npos) << message;
}

TEST_F(CoreToolsTest, RunCommandTimeoutIncludesPartialOutput) {
  auto res = registry.executeTool("run_terminal_command",
      {{"command", "echo early; sleep 30"}, {"timeout", 300}});
  EXPECT_EQ(res["error_type"], "timeout");
  EXPECT_NE(res["error"].get<std::string>().find("early"), std::string::npos) << res.dump(2);
}

TEST_F(CoreToolsTest, RunCommandRejectsTimeoutAboveOneDay) {
  auto res = registry.executeTool("run_terminal_command",
      {{"command", "echo hi"}, {"timeout", 9000000000000000LL}});
  EXPECT_EQ(res["error_type"], "invalid_arguments") << res.dump(2);

  auto day = registry.executeTool("run_terminal_command",
      {{"command", "echo hi"}, {"timeout", 24LL * 60 * 60 * 1000}});
  ASSERT_FALSE(ToolRegistry::isError(day)) << day.dump(2);
  EXPECT_EQ(textOf(day), "hi\n");
}

TEST_F(CoreToolsTest, RunCommandEmptyOutput) {
  auto res = registry.executeTool("run_terminal_command", {{"command", "true"}});
  EXPECT_EQ(textOf(res), "Command completed successfully");
}

TEST_F(CoreToolsTest, ListAllowedDirectories) {
  auto res = registry.executeTool("list_allowed_directories", nlohmann::json::object());
  ASSERT_FALSE(ToolRegistry::isError(res)) << res.dump(2);
  EXPECT_EQ(textOf(res), "Allowed directories:\n" + work.string());
  EXPECT_EQ(res["directories"][0], work.string());
}
