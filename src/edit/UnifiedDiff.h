#pragma once
#include <string>
#include <vector>

/**
 * @brief 行级 unified diff 生成 (Myers 算法)
 *
 * 输出格式:
 *   Index: <label>
 *   ===================================================================
 *   --- <label>\toriginal
 *   +++ <label>\tmodified
 *   @@ -a,b +c,d @@
 *
 * 不以换行结尾的最后一行后面跟 "\ No newline at end of file"。
 */
class UnifiedDiff {
public:
    static constexpr int kDefaultContext = 4;

    static std::string create(const std::string& original,
                              const std::string& modified,
                              const std::string& label = "file",
                              int contextLines = kDefaultContext);

    /**
     * @brief 用足够长的反引号围栏包裹 diff, 保证 diff 内容无法提前结束围栏
     */
    static std::string fence(const std::string& diff);

private:
    struct DiffHunk {
        size_t oldStart, oldCount, newStart, newCount;
        std::vector<std::string> lines;  // ' ', '+', '-' 前缀
    };

    enum class Op { Equal, Insert, Delete };

    struct Edit {
        Op op;
        size_t oldIndex;
        size_t newIndex;
    };

    // 每个元素保留自身的 '\n' (最后一行可能没有), 这样 "x" 与 "x\n" 不相等
    static std::vector<std::string> tokenize(const std::string& text);
    static std::vector<Edit> computeEdits(const std::vector<std::string>& a, const std::vector<std::string>& b);
    static void diffRange(const std::vector<int>& a, long aLo, long aHi,
                          const std::vector<int>& b, long bLo, long bHi,
                          std::vector<Edit>& out);
    /// 找到 [aLo,aHi) x [bLo,bHi) 的中间蛇, 返回切分点
    static bool findMiddleSnake(const std::vector<int>& a, long aLo, long aHi,
                                const std::vector<int>& b, long bLo, long bHi,
                                long& splitX, long& splitY);
    static void groupChanges(std::vector<Edit>& edits);
    static std::vector<DiffHunk> buildHunks(const std::vector<Edit>& edits,
                                            const std::vector<std::string>& a,
                                            const std::vector<std::string>& b,
                                            int contextLines);
    static void appendLine(std::vector<std::string>& out, char prefix, const std::string& token);
};
