#pragma once
#include <string>
#include <memory>
#include <map>
#include <future>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief 工具注册中心
 *
 * 统一管理所有工具的注册、查找和执行。
 * 这是工具层的唯一入口: 参数先按 schema 校验, 工具抛出的 WardenError
 * 在这里转换为结构化错误, 不会传播出去。
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief 注册一个工具 (同名工具会被覆盖)
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @return 工具指针, 不存在时返回 nullptr
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief 列出所有工具定义, 按名称排序
     *
     * 格式:
     * [
     *   {"name": "read_file", "description": "...", "inputSchema": { JSON Schema }}
     * ]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /**
     * @brief 执行工具
     *
     * 失败时返回:
     * {
     *   "error": "错误描述",
     *   "error_type": "access_denied" | "not_found" | ...,
     *   "isError": true,
     *   "content": [{"type": "text", "text": "Error: 错误描述"}]
     * }
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    /**
     * @brief 异步执行, 每次调用独立运行; 对同一文件的并发调用不加锁
     */
    std::future<nlohmann::json> executeToolAsync(const std::string& name, nlohmann::json args);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

    static bool isError(const nlohmann::json& result) {
        return result.is_object() && result.value("isError", false);
    }

private:
    std::map<std::string, std::unique_ptr<ITool>> tools;

    static nlohmann::json makeError(const std::string& kind, const std::string& message);
};
