#include "sandbox/PathResolver.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <stdexcept>

PathResolver::PathResolver(std::shared_ptr<const BoundarySet> boundaries)
    : boundarySet(std::move(boundaries)) {
    if (!boundarySet) {
        throw std::invalid_argument("PathResolver requires a boundary set");
    }
}

fs::path PathResolver::lexicalPath(const std::string& requestedPath) const {
    std::string expanded = PathUtils::expandHome(requestedPath.empty() ? "." : requestedPath);
    fs::path p(expanded);
    if (!p.is_absolute()) {
        p = boundarySet->baseDirectory() / p;
    }
    return PathUtils::normalize(p);
}

void PathResolver::denyUnlessContained(const fs::path& p, const std::string& what) const {
    if (boundarySet->contains(p)) return;
    std::string message = "Access denied - " + what + " outside allowed directories: " +
                          p.string() + " not in " + boundarySet->describe();
    Logger::getInstance().warn(message);
    throw AccessDenied(message);
}

ResolvedPath PathResolver::resolve(const std::string& requestedPath) const {
    const fs::path absolute = lexicalPath(requestedPath);

    // 先做纯词法检查: 边界外的路径不应通过不同的错误暴露其是否存在
    denyUnlessContained(absolute, "path");

    std::error_code ec;
    fs::path real = fs::canonical(absolute, ec);
    if (!ec) {
        real = PathUtils::normalize(real);
        denyUnlessContained(real, "symlink target");
        return {real, true};
    }

    // 目标不存在: realpath 对不存在的路径没有定义, 改为检查父目录
    const fs::path parent = absolute.parent_path();
    fs::path realParent = fs::canonical(parent, ec);
    if (ec) {
        throw NotFound("Parent directory does not exist: " + parent.string());
    }
    realParent = PathUtils::normalize(realParent);
    denyUnlessContained(realParent, "parent directory");

    // 悬空符号链接: 写入会跟随链接在边界外创建文件
    // 链可能有多跳 (link1 -> link2 -> ...), 每一跳都必须留在边界内
    fs::path link = absolute;
    fs::path linkParent = realParent;
    for (int hop = 0;; ++hop) {
        auto linkStatus = fs::symlink_status(link, ec);
        if (ec || !fs::is_symlink(linkStatus)) break;
        if (hop == kMaxSymlinkHops) {
            std::string message = "Access denied - too many levels of symbolic links: " + absolute.string();
            Logger::getInstance().warn(message);
            throw AccessDenied(message);
        }
        fs::path target = fs::read_symlink(link, ec);
        if (ec) {
            throw AccessDenied("Access denied - cannot read symlink " + link.string() + ": " + ec.message());
        }
        if (!target.is_absolute()) target = linkParent / target;
        fs::path weak = fs::weakly_canonical(target, ec);
        link = PathUtils::normalize(ec ? target : weak);
        denyUnlessContained(link, "symlink target");
        linkParent = link.parent_path();
    }

    return {absolute, false};
}

fs::path PathResolver::resolveExisting(const std::string& requestedPath) const {
    ResolvedPath resolved = resolve(requestedPath);
    if (!resolved.exists) {
        throw NotFound("No such file or directory: " + resolved.path.string());
    }
    return resolved.path;
}

fs::path PathResolver::resolveDirectory(const std::string& requestedPath) const {
    fs::path dir = resolveExisting(requestedPath);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw NotFound("Not a directory: " + dir.string());
    }
    return dir;
}
