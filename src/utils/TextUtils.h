#pragma once
#include <string>
#include <vector>

// 文本规范化辅助函数, 编辑引擎与工具共用
namespace TextUtils {
    /**
     * @brief CRLF -> LF。单独的 '\r' 保持不变。
     */
    std::string normalizeLineEndings(const std::string& text);

    /**
     * @brief 按 '\n' 切分, 保留空段: "a\n" -> {"a", ""}, "" -> {""}
     */
    std::vector<std::string> splitLines(const std::string& text);

    std::string joinLines(const std::vector<std::string>& lines);

    std::string trim(const std::string& s);
    std::string trimStart(const std::string& s);

    // 行首空白 (空格/制表符等)
    std::string leadingWhitespace(const std::string& s);

    bool isBlank(const std::string& s);

    /**
     * @brief 验证并清理 UTF-8 字符串, 无效的起始字节替换为 '?', 孤立续字节丢弃
     */
    std::string sanitizeUtf8(const std::string& input);
}
