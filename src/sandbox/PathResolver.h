#pragma once
#include <memory>
#include <string>
#include <filesystem>
#include "sandbox/BoundarySet.h"

namespace fs = std::filesystem;

struct ResolvedPath {
    fs::path path;
    bool exists = false;

    bool operator==(const ResolvedPath& other) const {
        return path == other.path && exists == other.exists;
    }
};

/**
 * @brief 路径解析器
 *
 * 所有访问文件系统的工具在做任何 I/O 之前都必须经过这里。
 *
 * 解析流程:
 * 1. 展开 ~
 * 2. 相对路径以 BoundarySet::baseDirectory() 为基准
 * 3. 词法规范化
 * 4. 规范化后的路径不在边界内 → AccessDenied (此时尚未访问文件系统)
 * 5. realpath 成功 → 再次检查 realpath (防止符号链接逃逸), 返回 realpath, exists=true
 * 6. 目标不存在 → 检查父目录的 realpath, 返回规范化路径, exists=false
 */
class PathResolver {
public:
    explicit PathResolver(std::shared_ptr<const BoundarySet> boundaries);

    /**
     * @throws AccessDenied 路径、realpath 或父目录 realpath 不在边界内
     * @throws NotFound 目标不存在且父目录也不存在
     */
    ResolvedPath resolve(const std::string& requestedPath) const;

    /**
     * @brief 同 resolve, 但目标必须已存在
     * @throws NotFound 目标不存在
     */
    fs::path resolveExisting(const std::string& requestedPath) const;

    /**
     * @brief 同 resolve, 但目标必须是已存在的目录 (命令工作目录、搜索根)
     */
    fs::path resolveDirectory(const std::string& requestedPath) const;

    /**
     * @brief 步骤 1-3: 展开 ~、补全为绝对路径并词法规范化, 不做任何检查
     */
    fs::path lexicalPath(const std::string& requestedPath) const;

    const BoundarySet& boundaries() const { return *boundarySet; }

private:
    static constexpr int kMaxSymlinkHops = 40;

    std::shared_ptr<const BoundarySet> boundarySet;

    void denyUnlessContained(const fs::path& p, const std::string& what) const;
};
