#pragma once
#include "ITool.h"
#include <chrono>
#include <memory>
#include <filesystem>

namespace fs = std::filesystem;

class PathResolver;
class IProcessRunner;
class ToolRegistry;
struct Config;

/**
 * @brief 读取文件工具
 *
 * 返回整个文件内容 (UTF-8 清理后)。目录会被拒绝。
 */
class ReadFileTool : public ITool {
public:
    explicit ReadFileTool(std::shared_ptr<const PathResolver> resolver);

    std::string getName() const override { return "read_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<const PathResolver> resolver;
};

/**
 * @brief 列出目录工具
 *
 * 每行 "[DIR] name" 或 "[FILE] name", 按名称排序, 不递归。
 */
class ListDirectoryTool : public ITool {
public:
    explicit ListDirectoryTool(std::shared_ptr<const PathResolver> resolver);

    std::string getName() const override { return "list_directory"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<const PathResolver> resolver;
};

/**
 * @brief 按文件名搜索工具 (find -name *pattern*)
 */
class SearchFilesTool : public ITool {
public:
    SearchFilesTool(std::shared_ptr<const PathResolver> resolver,
                    std::shared_ptr<IProcessRunner> runner,
                    std::chrono::milliseconds timeout);

    std::string getName() const override { return "search_files"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<const PathResolver> resolver;
    std::shared_ptr<IProcessRunner> runner;
    std::chrono::milliseconds timeout;
};

/**
 * @brief 编辑文件工具
 *
 * edits[] 按顺序应用 (见 EditEngine), 返回 unified diff。
 * dryRun=true 时只返回 diff, 不写入。
 */
class EditFileTool : public ITool {
public:
    explicit EditFileTool(std::shared_ptr<const PathResolver> resolver);

    std::string getName() const override { return "edit_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<const PathResolver> resolver;
};

/**
 * @brief 删除文件工具
 *
 * 只删除文件 (或符号链接本身), 不删除目录。
 */
class DeleteFileTool : public ITool {
public:
    explicit DeleteFileTool(std::shared_ptr<const PathResolver> resolver);

    std::string getName() const override { return "delete_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<const PathResolver> resolver;
};

/**
 * @brief 运行命令工具
 *
 * 通过 sh -c 执行, 工作目录必须在边界内; 超时后终止子进程并返回已有输出。
 */
class RunTerminalCommandTool : public ITool {
public:
    RunTerminalCommandTool(std::shared_ptr<const PathResolver> resolver,
                           std::shared_ptr<IProcessRunner> runner,
                           std::chrono::milliseconds defaultTimeout);

    std::string getName() const override { return "run_terminal_command"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<const PathResolver> resolver;
    std::shared_ptr<IProcessRunner> runner;
    std::chrono::milliseconds defaultTimeout;

    fs::path defaultWorkingDirectory() const;
};

class ListAllowedDirectoriesTool : public ITool {
public:
    explicit ListAllowedDirectoriesTool(std::shared_ptr<const PathResolver> resolver);

    std::string getName() const override { return "list_allowed_directories"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<const PathResolver> resolver;
};

/**
 * @brief 注册全部内置工具 (文件工具、搜索工具、命令工具)
 */
void registerBuiltinTools(ToolRegistry& registry,
                          std::shared_ptr<const PathResolver> resolver,
                          std::shared_ptr<IProcessRunner> runner,
                          const Config& config);
