#pragma once
#include "ITool.h"
#include <chrono>
#include <memory>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

class PathResolver;
class IProcessRunner;

/**
 * @brief 单个搜索根的结果
 *
 * 多根搜索时每个根都有一条记录: 无法访问的根记为 ok=false 并附带原因,
 * 这样调用方能区分"没有匹配"和"部分根不可访问"。
 */
struct RootSearchOutcome {
    fs::path root;
    bool ok = true;
    std::string error;
    std::vector<std::string> lines;

    nlohmann::json toJson() const;
};

/**
 * @brief 搜索工具公共部分: 决定搜索根, 汇总各根的结果
 */
class SearchToolBase : public ITool {
protected:
    SearchToolBase(std::shared_ptr<const PathResolver> resolver,
                   std::shared_ptr<IProcessRunner> runner,
                   std::chrono::milliseconds timeout);

    /**
     * @brief 显式路径: 只搜索它 (越界直接抛 AccessDenied); 否则搜索全部边界目录
     */
    std::vector<fs::path> searchRoots(const nlohmann::json& args, const std::string& pathKey) const;

    /**
     * @brief 格式化结果文本并附上 roots[] 明细
     */
    static nlohmann::json buildResult(const std::vector<RootSearchOutcome>& outcomes,
                                      const std::string& separator);

    std::shared_ptr<const PathResolver> resolver;
    std::shared_ptr<IProcessRunner> runner;
    std::chrono::milliseconds timeout;
};

/**
 * @brief 代码库搜索工具
 *
 * 不区分大小写的文本搜索, 可按扩展名过滤, 每个文件最多返回 3 行,
 * maxResults 限制的是文件数。
 */
class CodebaseSearchTool : public SearchToolBase {
public:
    CodebaseSearchTool(std::shared_ptr<const PathResolver> resolver,
                       std::shared_ptr<IProcessRunner> runner,
                       std::chrono::milliseconds timeout,
                       int defaultMaxResults = 50);

    std::string getName() const override { return "codebase_search"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    int defaultMaxResults;
};

/**
 * @brief grep 搜索工具
 *
 * grep -r -n, 默认不区分大小写, filePattern 对应 --include。
 * 输出 "path:line:content", maxResults 限制的是行数。
 */
class GrepSearchTool : public SearchToolBase {
public:
    GrepSearchTool(std::shared_ptr<const PathResolver> resolver,
                   std::shared_ptr<IProcessRunner> runner,
                   std::chrono::milliseconds timeout,
                   int defaultMaxResults = 100);

    std::string getName() const override { return "grep_search"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    int defaultMaxResults;
};

namespace GrepOutput {
    struct Match {
        std::string file;
        int line = 0;
        std::string content;
    };

    /**
     * @brief 解析 grep -Z -n 的输出 ("path\0line:content")
     */
    std::vector<Match> parse(const std::string& output);
}
