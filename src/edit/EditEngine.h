#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

struct EditOperation {
    std::string oldText;
    std::string newText;
};

void from_json(const nlohmann::json& j, EditOperation& op);

struct EditResult {
    std::string originalContent;
    std::string newContent;
    std::string diff;  // 围栏包裹的 unified diff
};

/**
 * @brief 安全编辑引擎
 *
 * 按顺序对 (oldText, newText) 做替换, 每一条都作用在前面编辑之后的内容上。
 * 匹配策略:
 * 1. 精确子串匹配, 替换第一次出现
 * 2. 行窗口匹配: 逐行去掉首尾空白后比较, 取第一个匹配窗口, 并按匹配处的缩进重排新文本
 * 3. 都不匹配 → EditConflict
 *
 * 多个窗口同时匹配时取最靠前的一个, 调用方需提供足够的上下文避免歧义。
 */
class EditEngine {
public:
    /**
     * @param label diff 头中显示的文件名
     * @throws EditConflict
     */
    static EditResult applyEdits(const std::string& originalText,
                                 const std::vector<EditOperation>& edits,
                                 const std::string& label = "file");

    /**
     * @brief 读取文件, 应用编辑; dryRun 为 false 时写回 (临时文件 + rename)
     *
     * path 必须已经过 PathResolver 校验。
     */
    static EditResult applyToFile(const fs::path& path,
                                  const std::vector<EditOperation>& edits,
                                  bool dryRun);

    /**
     * @brief 单条编辑, 返回替换后的内容
     * @throws EditConflict
     */
    static std::string applyOne(const std::string& content, const EditOperation& edit);

private:
    /// onlyLine 为 npos 时扫描全文, 否则只尝试从该行开始的窗口
    static bool tryLineWindow(std::string& content, const std::string& oldText, const std::string& newText,
                              size_t onlyLine = std::string::npos);
    static std::vector<std::string> reindent(const std::vector<std::string>& oldLines,
                                             const std::vector<std::string>& newLines,
                                             const std::string& baseIndent);
    static void writeAtomically(const fs::path& path, const std::string& content);
};
