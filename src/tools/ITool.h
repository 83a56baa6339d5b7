#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 工具接口定义
 *
 * 所有工具必须实现此接口。工具只负责"校验路径 + 执行",
 * 路径必须先经过 PathResolver, 失败时抛出 WardenError 子类,
 * 由 ToolRegistry 转换为错误结果。
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief 获取工具名称
     * @return 工具的唯一标识名称
     */
    virtual std::string getName() const = 0;

    /**
     * @brief 获取工具描述
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief 获取工具的 JSON Schema
     * @return 参数定义 (type/properties/required), ToolRegistry 按它校验参数
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief 执行工具操作
     * @param args 工具参数 (已通过 schema 校验)
     * @return 执行结果
     *
     * 返回格式遵循 MCP 标准:
     * {
     *   "content": [
     *     {"type": "text", "text": "结果内容"}
     *   ]
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};

inline nlohmann::json makeTextResult(const std::string& text) {
    nlohmann::json contentItem;
    contentItem["type"] = "text";
    contentItem["text"] = text;

    nlohmann::json result;
    result["content"] = nlohmann::json::array({contentItem});
    return result;
}
