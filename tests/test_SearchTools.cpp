/**
 * 搜索工具测试: 真实 grep 的匹配格式与数量限制, 以及多根搜索时
 * 单个根失败不影响其他根 (用假的 IProcessRunner 模拟)。
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/Errors.h"
#include "process/ProcessRunner.h"
#include "sandbox/BoundarySet.h"
#include "sandbox/PathResolver.h"
#include "tools/SearchTools.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static void createFile(const fs::path& p, const std::string& content) {
  std::ofstream f(p);
  ASSERT_TRUE(f.is_open()) << "create " << p.u8string();
  f << content;
}

static std::string textOf(const nlohmann::json& res) {
  return res["content"][0]["text"].get<std::string>();
}

static fs::path makeTempRoot(const std::string& name) {
  fs::path root = fs::temp_directory_path() / name;
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root);
  return fs::canonical(root);
}

static std::shared_ptr<const PathResolver> resolverFor(const std::vector<fs::path>& roots) {
  std::vector<std::string> dirs;
  for (const auto& r : roots) dirs.push_back(r.string());
  return std::make_shared<const PathResolver>(std::make_shared<const BoundarySet>(BoundarySet::fromDirectories(dirs)));
}

// 对指定的根返回 grep 错误, 其余根交给真实的 ProcessRunner
class FailingRootRunner : public IProcessRunner {
public:
  explicit FailingRootRunner(fs::path failing) : failing(std::move(failing)) {}

  ProcessResult run(const std::string& command, const std::vector<std::string>& args,
                    const fs::path& workingDirectory, std::chrono::milliseconds timeout) override {
    if (!args.empty() && fs::path(args.back()) == failing) {
      return {"", "grep: " + failing.string() + ": Permission denied\n", 2};
    }
    return real.run(command, args, workingDirectory, timeout);
  }

private:
  fs::path failing;
  ProcessRunner real;
};

TEST(GrepOutput, ParsesNulSeparatedRecords) {
  std::string out = std::string("/w/a.txt") + '\0' + "2:has: colons\n" + std::string("/w/b c.txt") + '\0' + "10:x\n";
  auto matches = GrepOutput::parse(out);
  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(matches[0].file, "/w/a.txt");
  EXPECT_EQ(matches[0].line, 2);
  EXPECT_EQ(matches[0].content, "has: colons");
  EXPECT_EQ(matches[1].file, "/w/b c.txt");
  EXPECT_EQ(matches[1].line, 10);
}

TEST(GrepSearchTool, FindsLinesWithPathAndLineNumber) {
  fs::path root = makeTempRoot("warden_grep_find");
  createFile(root / "a.txt", "line1\nWardenGrepToken\nline3\n");
  createFile(root / "b.txt", "nothing here\n");

  GrepSearchTool tool(resolverFor({root}), std::make_shared<ProcessRunner>(), 5000ms);
  auto res = tool.execute({{"pattern", "wardengreptoken"}});
  ASSERT_EQ(res["matches"].size(), 1u) << res.dump(2);
  EXPECT_EQ(res["matches"][0], (root / "a.txt").string() + ":2:WardenGrepToken");
  EXPECT_EQ(res["roots"][0]["status"], "ok");
  fs::remove_all(root);
}

TEST(GrepSearchTool, CaseSensitiveAndFilePattern) {
  fs::path root = makeTempRoot("warden_grep_case");
  createFile(root / "a.cpp", "Token\ntoken\n");
  createFile(root / "a.txt", "Token\n");

  GrepSearchTool tool(resolverFor({root}), std::make_shared<ProcessRunner>(), 5000ms);
  auto res = tool.execute({{"pattern", "Token"}, {"caseSensitive", true}, {"filePattern", "*.cpp"}});
  ASSERT_EQ(res["matches"].size(), 1u) << res.dump(2);
  EXPECT_EQ(res["matches"][0], (root / "a.cpp").string() + ":1:Token");
  fs::remove_all(root);
}

TEST(GrepSearchTool, RespectsMaxResults) {
  fs::path root = makeTempRoot("warden_grep_max");
  std::string many;
  for (int i = 0; i < 50; ++i) many += "SameLine\n";
  createFile(root / "many.txt", many);

  GrepSearchTool tool(resolverFor({root}), std::make_shared<ProcessRunner>(), 5000ms, 100);
  auto res = tool.execute({{"pattern", "SameLine"}, {"maxResults", 5}});
  EXPECT_EQ(res["matches"].size(), 5u);
  fs::remove_all(root);
}

TEST(GrepSearchTool, NoMatchesIsNotAnError) {
  fs::path root = makeTempRoot("warden_grep_none");
  createFile(root / "a.txt", "abc\n");
  GrepSearchTool tool(resolverFor({root}), std::make_shared<ProcessRunner>(), 5000ms);
  auto res = tool.execute({{"pattern", "zzz"}});
  EXPECT_EQ(textOf(res), "No matches found");
  EXPECT_EQ(res["roots"][0]["status"], "ok");
  fs::remove_all(root);
}

TEST(GrepSearchTool, ExplicitPathOutsideIsDenied) {
  fs::path root = makeTempRoot("warden_grep_denied");
  fs::path other = makeTempRoot("warden_grep_denied_other");
  GrepSearchTool tool(resolverFor({root}), std::make_shared<ProcessRunner>(), 5000ms);
  EXPECT_THROW(tool.execute({{"pattern", "x"}, {"path", other.string()}}), AccessDenied);
  fs::remove_all(root);
  fs::remove_all(other);
}

TEST(GrepSearchTool, FailingRootIsReportedAlongsideOtherMatches) {
  fs::path good = makeTempRoot("warden_grep_multi_good");
  fs::path bad = makeTempRoot("warden_grep_multi_bad");
  createFile(good / "a.txt", "needle\n");
  createFile(bad / "b.txt", "needle\n");

  GrepSearchTool tool(resolverFor({good, bad}), std::make_shared<FailingRootRunner>(bad), 5000ms);
  auto res = tool.execute({{"pattern", "needle"}});
  ASSERT_EQ(res["matches"].size(), 1u) << res.dump(2);
  ASSERT_EQ(res["roots"].size(), 2u);
  EXPECT_EQ(res["roots"][0]["status"], "ok");
  EXPECT_EQ(res["roots"][1]["status"], "error");
  EXPECT_NE(res["roots"][1]["error"].get<std::string>().find("Permission denied"), std::string::npos);
  EXPECT_NE(textOf(res).find("could not be searched"), std::string::npos) << textOf(res);
  fs::remove_all(good);
  fs::remove_all(bad);
}

TEST(CodebaseSearchTool, GroupsUpToThreeLinesPerFile) {
  fs::path root = makeTempRoot("warden_codebase_group");
  createFile(root / "a.cpp", "foo one\nfoo two\nbar\nfoo three\nfoo four\n");
  createFile(root / "b.h", "FOO header\n");
  createFile(root / "c.txt", "foo text\n");

  CodebaseSearchTool tool(resolverFor({root}), std::make_shared<ProcessRunner>(), 5000ms);
  auto res = tool.execute({{"query", "foo"}, {"fileTypes", {"cpp", ".h"}}});
  ASSERT_EQ(res["matches"].size(), 2u) << res.dump(2);

  std::string text = textOf(res);
  EXPECT_NE(text.find((root / "a.cpp").string() + ":\n1:foo one\n2:foo two\n4:foo three"), std::string::npos) << text;
  EXPECT_EQ(text.find("foo four"), std::string::npos) << text;
  EXPECT_NE(text.find("1:FOO header"), std::string::npos) << text;
  EXPECT_EQ(text.find("foo text"), std::string::npos) << text;
  fs::remove_all(root);
}

TEST(CodebaseSearchTool, MaxResultsLimitsFiles) {
  fs::path root = makeTempRoot("warden_codebase_max");
  for (int i = 0; i < 5; ++i) createFile(root / ("f" + std::to_string(i) + ".txt"), "match\n");

  CodebaseSearchTool tool(resolverFor({root}), std::make_shared<ProcessRunner>(), 5000ms);
  auto res = tool.execute({{"query", "match"}, {"maxResults", 2}});
  EXPECT_EQ(res["matches"].size(), 2u) << res.dump(2);
  fs::remove_all(root);
}

TEST(CodebaseSearchTool, SearchPathRestrictsToOneRoot) {
  fs::path first = makeTempRoot("warden_codebase_path_a");
  fs::path second = makeTempRoot("warden_codebase_path_b");
  createFile(first / "a.txt", "shared\n");
  createFile(second / "b.txt", "shared\n");

  CodebaseSearchTool tool(resolverFor({first, second}), std::make_shared<ProcessRunner>(), 5000ms);
  auto all = tool.execute({{"query", "shared"}});
  EXPECT_EQ(all["matches"].size(), 2u) << all.dump(2);

  auto one = tool.execute({{"query", "shared"}, {"searchPath", second.string()}});
  ASSERT_EQ(one["matches"].size(), 1u) << one.dump(2);
  EXPECT_EQ(one["roots"].size(), 1u);
  EXPECT_NE(one["matches"][0].get<std::string>().find("b.txt"), std::string::npos);
  fs::remove_all(first);
  fs::remove_all(second);
}

TEST(CodebaseSearchTool, EmptyQueryIsInvalid) {
  fs::path root = makeTempRoot("warden_codebase_empty");
  CodebaseSearchTool tool(resolverFor({root}), std::make_shared<ProcessRunner>(), 5000ms);
  EXPECT_THROW(tool.execute({{"query", ""}}), InvalidArguments);
  fs::remove_all(root);
}
