#include "sandbox/BoundarySet.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

// ============================================================================
// PathUtils
// ============================================================================

namespace PathUtils {

std::string homeDirectory() {
    const char* home = std::getenv("HOME");
    if (home && *home) return home;
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return pw->pw_dir;
    return "";
}

static bool needsHome(const std::string& path) {
    return path == "~" || path.rfind("~/", 0) == 0;
}

std::string expandHome(const std::string& path) {
    if (!needsHome(path)) return path;
    return expandHome(path, homeDirectory());
}

std::string expandHome(const std::string& path, const std::string& home) {
    if (!needsHome(path)) return path;
    if (home.empty()) {
        throw NotFound("Cannot expand " + path + ": home directory is unknown");
    }
    if (path == "~") return home;
    return (fs::path(home) / path.substr(2)).string();
}

fs::path normalize(const fs::path& p) {
    std::string s = p.lexically_normal().generic_string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    if (s.empty()) s = ".";
    return fs::path(s);
}

bool isWithin(const fs::path& root, const fs::path& candidate) {
    const std::string r = normalize(root).generic_string();
    const std::string c = normalize(candidate).generic_string();
    if (r == "/") return !c.empty() && c.front() == '/';
    if (c == r) return true;
    // 按路径段对齐: /a/bc 不在 /a/b 之内
    return c.size() > r.size() && c.compare(0, r.size(), r) == 0 && c[r.size()] == '/';
}

}

// ============================================================================
// BoundarySet Implementation
// ============================================================================

namespace {

fs::path canonicalRoot(const std::string& configured) {
    std::string expanded;
    try {
        expanded = PathUtils::expandHome(configured);
    } catch (const NotFound& e) {
        throw ConfigError(std::string("Cannot resolve boundary directory: ") + e.what());
    }
    if (expanded.empty()) {
        throw ConfigError("Boundary directory is empty");
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(expanded), ec);
    if (ec) {
        throw ConfigError("Cannot resolve boundary directory " + configured + ": " + ec.message());
    }
    if (!fs::exists(absolute, ec)) {
        throw ConfigError("Boundary directory does not exist: " + absolute.string());
    }
    if (!fs::is_directory(absolute, ec)) {
        throw ConfigError("Boundary path is not a directory: " + absolute.string());
    }

    fs::path real = fs::canonical(absolute, ec);
    if (ec) {
        throw ConfigError("Cannot canonicalize boundary directory " + absolute.string() + ": " + ec.message());
    }
    return PathUtils::normalize(real);
}

}

BoundarySet::BoundarySet(std::vector<fs::path> roots, fs::path base, bool single)
    : rootDirs(std::move(roots)), baseDir(std::move(base)), singleRoot(single) {}

BoundarySet BoundarySet::create(const Source& source) {
    if (const auto* wd = std::get_if<WorkingDirectory>(&source)) {
        return fromWorkingDirectory(wd->path);
    }
    return fromDirectories(std::get<ExplicitRoots>(source).directories);
}

BoundarySet BoundarySet::fromWorkingDirectory(const std::string& path) {
    std::string dir = path;
    if (dir.empty()) {
        std::error_code ec;
        dir = fs::current_path(ec).string();
        if (ec) {
            throw ConfigError("Cannot determine current working directory: " + ec.message());
        }
    }
    fs::path root = canonicalRoot(dir);
    Logger::getInstance().debug("Boundary (working directory): " + root.string());
    return BoundarySet({root}, root, true);
}

BoundarySet BoundarySet::fromDirectories(const std::vector<std::string>& directories) {
    if (directories.empty()) {
        throw ConfigError("At least one allowed directory must be specified");
    }

    std::vector<fs::path> roots;
    for (const auto& dir : directories) {
        fs::path root = canonicalRoot(dir);
        if (std::find(roots.begin(), roots.end(), root) == roots.end()) {
            roots.push_back(root);
        }
    }

    std::error_code ec;
    fs::path base = fs::current_path(ec);
    if (ec) {
        throw ConfigError("Cannot determine current working directory: " + ec.message());
    }

    BoundarySet set(std::move(roots), PathUtils::normalize(base), false);
    Logger::getInstance().debug("Boundary (explicit roots): " + set.describe());
    return set;
}

bool BoundarySet::contains(const fs::path& candidate) const {
    if (!candidate.is_absolute()) return false;
    for (const auto& root : rootDirs) {
        if (PathUtils::isWithin(root, candidate)) return true;
    }
    return false;
}

std::string BoundarySet::describe() const {
    std::string out;
    for (size_t i = 0; i < rootDirs.size(); ++i) {
        if (i > 0) out += ", ";
        out += rootDirs[i].string();
    }
    return out;
}
