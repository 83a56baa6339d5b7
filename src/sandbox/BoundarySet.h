#pragma once
#include <string>
#include <vector>
#include <variant>
#include <filesystem>

namespace fs = std::filesystem;

/**
 * @brief 边界目录集合
 *
 * 启动时构建一次, 之后不可变。所有成员都是已存在目录的 canonical 绝对路径。
 * 包含判断按路径段对齐的前缀比较: /a/bc 不在 /a/b 之内。
 *
 * 两种构建方式:
 * - WorkingDirectory: 单一根目录 (默认: 启动时的当前目录), 相对路径以它为基准
 * - ExplicitRoots: 启动参数给出的多个目录, 相对路径以构建时的进程当前目录为基准
 */
class BoundarySet {
public:
    struct WorkingDirectory {
        std::string path;
    };

    struct ExplicitRoots {
        std::vector<std::string> directories;
    };

    using Source = std::variant<WorkingDirectory, ExplicitRoots>;

    /**
     * @brief 根据配置构建
     * @throws ConfigError 任一目录不存在或不是目录, 或显式列表为空
     */
    static BoundarySet create(const Source& source);

    static BoundarySet fromWorkingDirectory(const std::string& path);
    static BoundarySet fromDirectories(const std::vector<std::string>& directories);

    /**
     * @brief candidate 是否等于某个根目录或位于其下
     *
     * 只做词法比较 (candidate 先 lexically_normal), 不访问文件系统。
     * 相对路径一律视为不在边界内。
     */
    bool contains(const fs::path& candidate) const;

    const std::vector<fs::path>& roots() const { return rootDirs; }

    // 相对路径的解析基准
    const fs::path& baseDirectory() const { return baseDir; }

    bool isSingleRoot() const { return singleRoot; }

    // "/a, /b" 形式, 用于错误信息
    std::string describe() const;

private:
    BoundarySet(std::vector<fs::path> roots, fs::path base, bool single);

    std::vector<fs::path> rootDirs;
    fs::path baseDir;
    bool singleRoot;
};

namespace PathUtils {
    /**
     * @brief 展开 "~" 与 "~/..." (不处理 "~user")
     * @throws NotFound 需要展开但无法确定 home 目录 (HOME 与 passwd 均不可用)
     */
    std::string expandHome(const std::string& path);

    /// 同上, home 由调用方给出; 空字符串表示未知
    std::string expandHome(const std::string& path, const std::string& home);

    std::string homeDirectory();

    /**
     * @brief 词法规范化: 折叠 . / .. 与重复分隔符, 去掉末尾分隔符 (根目录除外)
     */
    fs::path normalize(const fs::path& p);

    /**
     * @brief candidate 是否为 root 本身或按路径段位于 root 之下
     */
    bool isWithin(const fs::path& root, const fs::path& candidate);
}
