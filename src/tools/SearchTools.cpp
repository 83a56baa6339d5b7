#include "SearchTools.h"
#include "core/Errors.h"
#include "process/ProcessRunner.h"
#include "sandbox/PathResolver.h"
#include "utils/Logger.h"
#include <algorithm>
#include <sstream>

// ============================================================================
// GrepOutput
// ============================================================================

namespace GrepOutput {

std::vector<Match> parse(const std::string& output) {
    std::vector<Match> matches;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t nul = line.find('\0');
        if (nul == std::string::npos) continue;
        size_t colon = line.find(':', nul + 1);
        if (colon == std::string::npos) continue;

        Match m;
        m.file = line.substr(0, nul);
        try {
            m.line = std::stoi(line.substr(nul + 1, colon - nul - 1));
        } catch (const std::exception&) {
            continue;
        }
        m.content = line.substr(colon + 1);
        matches.push_back(std::move(m));
    }
    return matches;
}

}

// ============================================================================
// SearchToolBase
// ============================================================================

nlohmann::json RootSearchOutcome::toJson() const {
    nlohmann::json j;
    j["root"] = root.string();
    j["status"] = ok ? "ok" : "error";
    j["matches"] = static_cast<int>(lines.size());
    if (!ok) j["error"] = error;
    return j;
}

SearchToolBase::SearchToolBase(std::shared_ptr<const PathResolver> resolver,
                               std::shared_ptr<IProcessRunner> runner,
                               std::chrono::milliseconds timeout)
    : resolver(std::move(resolver)), runner(std::move(runner)), timeout(timeout) {}

std::vector<fs::path> SearchToolBase::searchRoots(const nlohmann::json& args, const std::string& pathKey) const {
    if (args.contains(pathKey) && args[pathKey].is_string()) {
        return {resolver->resolveExisting(args[pathKey].get<std::string>())};
    }
    return resolver->boundaries().roots();
}

nlohmann::json SearchToolBase::buildResult(const std::vector<RootSearchOutcome>& outcomes,
                                           const std::string& separator) {
    std::vector<std::string> all;
    std::string failures;
    nlohmann::json roots = nlohmann::json::array();
    for (const auto& o : outcomes) {
        all.insert(all.end(), o.lines.begin(), o.lines.end());
        roots.push_back(o.toJson());
        if (!o.ok) failures += "\n" + o.root.string() + ": " + o.error;
    }

    std::string text;
    for (size_t i = 0; i < all.size(); ++i) {
        if (i > 0) text += separator;
        text += all[i];
    }
    if (all.empty()) text = "No matches found";
    if (!failures.empty()) text += "\n\nSome search roots could not be searched:" + failures;

    nlohmann::json result = makeTextResult(text);
    result["matches"] = all;
    result["roots"] = roots;
    return result;
}

// ============================================================================
// CodebaseSearchTool Implementation
// ============================================================================

CodebaseSearchTool::CodebaseSearchTool(std::shared_ptr<const PathResolver> resolver,
                                       std::shared_ptr<IProcessRunner> runner,
                                       std::chrono::milliseconds timeout,
                                       int defaultMaxResults)
    : SearchToolBase(std::move(resolver), std::move(runner), timeout), defaultMaxResults(defaultMaxResults) {}

std::string CodebaseSearchTool::getDescription() const {
    return "Case-insensitive text search across files. Optionally limit to searchPath (within the allowed "
           "directories) and to file extensions; otherwise every allowed directory is searched. "
           "Returns up to 3 matching lines per file.";
}

nlohmann::json CodebaseSearchTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"query", {
                {"type", "string"},
                {"description", "Text to search for"}
            }},
            {"searchPath", {
                {"type", "string"},
                {"description", "Directory to search in (if not provided, searches all allowed directories)"}
            }},
            {"fileTypes", {
                {"type", "array"},
                {"items", {{"type", "string"}}},
                {"description", "File extensions to include, e.g. [\"cpp\", \".h\"] (optional)"}
            }},
            {"maxResults", {
                {"type", "integer"},
                {"description", "Maximum number of files to report (default " + std::to_string(defaultMaxResults) + ")"}
            }}
        }},
        {"required", {"query"}}
    };
}

nlohmann::json CodebaseSearchTool::execute(const nlohmann::json& args) {
    const std::string query = args["query"].get<std::string>();
    if (query.empty()) {
        throw InvalidArguments("query must be non-empty");
    }
    const auto fileTypes = args.value("fileTypes", std::vector<std::string>{});
    int maxResults = args.value("maxResults", defaultMaxResults);
    if (maxResults <= 0) maxResults = defaultMaxResults;

    std::vector<std::string> baseArgs = {"-r", "-n", "-i", "-I", "-Z", "-m", "3"};
    for (const auto& type : fileTypes) {
        if (type.empty()) continue;
        std::string ext = type[0] == '.' ? type : "." + type;
        baseArgs.push_back("--include=*" + ext);
    }
    baseArgs.insert(baseArgs.end(), {"-e", query, "--"});

    std::vector<RootSearchOutcome> outcomes;
    int files = 0;
    for (const auto& root : searchRoots(args, "searchPath")) {
        if (files >= maxResults) break;

        RootSearchOutcome outcome;
        outcome.root = root;
        std::vector<std::string> grepArgs = baseArgs;
        grepArgs.push_back(root.string());
        std::error_code ec;
        fs::path cwd = fs::is_directory(root, ec) ? root : root.parent_path();
        try {
            ProcessResult found = runner->run("grep", grepArgs, cwd, timeout);
            if (found.exitCode > 1) {
                outcome.ok = false;
                outcome.error = found.stderrText.empty() ? "grep exited with code " + std::to_string(found.exitCode) : found.stderrText;
                while (!outcome.error.empty() && outcome.error.back() == '\n') outcome.error.pop_back();
            }

            // group by file, preserving grep order
            std::string currentFile;
            std::string block;
            auto flush = [&]() {
                if (!currentFile.empty()) outcome.lines.push_back(block);
            };
            for (const auto& m : GrepOutput::parse(found.stdoutText)) {
                if (m.file != currentFile) {
                    flush();
                    if (files >= maxResults) {
                        currentFile.clear();
                        break;
                    }
                    currentFile = m.file;
                    block = m.file + ":\n";
                    ++files;
                } else {
                    block += "\n";
                }
                block += std::to_string(m.line) + ":" + m.content;
            }
            flush();
        } catch (const WardenError& e) {
            outcome.ok = false;
            outcome.error = e.what();
        }

        if (!outcome.ok) {
            Logger::getInstance().warn("codebase_search: " + root.string() + ": " + outcome.error);
        }
        outcomes.push_back(std::move(outcome));
    }

    return buildResult(outcomes, "\n\n");
}

// ============================================================================
// GrepSearchTool Implementation
// ============================================================================

GrepSearchTool::GrepSearchTool(std::shared_ptr<const PathResolver> resolver,
                               std::shared_ptr<IProcessRunner> runner,
                               std::chrono::milliseconds timeout,
                               int defaultMaxResults)
    : SearchToolBase(std::move(resolver), std::move(runner), timeout), defaultMaxResults(defaultMaxResults) {}

std::string GrepSearchTool::getDescription() const {
    return "Search file contents with grep (recursive, with line numbers). Optionally limit to a path within "
           "the allowed directories and to a filename glob; otherwise every allowed directory is searched. "
           "Case-insensitive unless caseSensitive is true.";
}

nlohmann::json GrepSearchTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"pattern", {
                {"type", "string"},
                {"description", "grep pattern (basic regular expression)"}
            }},
            {"path", {
                {"type", "string"},
                {"description", "File or directory to search (optional)"}
            }},
            {"filePattern", {
                {"type", "string"},
                {"description", "Filename glob passed to --include (default '*')"}
            }},
            {"caseSensitive", {
                {"type", "boolean"},
                {"description", "Case-sensitive match (default false)"}
            }},
            {"maxResults", {
                {"type", "integer"},
                {"description", "Maximum number of matching lines (default " + std::to_string(defaultMaxResults) + ")"}
            }}
        }},
        {"required", {"pattern"}}
    };
}

nlohmann::json GrepSearchTool::execute(const nlohmann::json& args) {
    const std::string pattern = args["pattern"].get<std::string>();
    if (pattern.empty()) {
        throw InvalidArguments("pattern must be non-empty");
    }
    const std::string filePattern = args.value("filePattern", std::string("*"));
    const bool caseSensitive = args.value("caseSensitive", false);
    int maxResults = args.value("maxResults", defaultMaxResults);
    if (maxResults <= 0) maxResults = defaultMaxResults;

    std::vector<std::string> baseArgs = {"-r", "-n", "-I", "-Z"};
    if (!caseSensitive) baseArgs.push_back("-i");
    if (!filePattern.empty() && filePattern != "*") baseArgs.push_back("--include=" + filePattern);
    baseArgs.insert(baseArgs.end(), {"-e", pattern, "--"});

    std::vector<RootSearchOutcome> outcomes;
    int total = 0;
    for (const auto& root : searchRoots(args, "path")) {
        if (total >= maxResults) break;

        RootSearchOutcome outcome;
        outcome.root = root;
        std::vector<std::string> grepArgs = baseArgs;
        grepArgs.push_back(root.string());
        std::error_code ec;
        fs::path cwd = fs::is_directory(root, ec) ? root : root.parent_path();
        try {
            ProcessResult found = runner->run("grep", grepArgs, cwd, timeout);
            if (found.exitCode > 1) {
                outcome.ok = false;
                outcome.error = found.stderrText.empty() ? "grep exited with code " + std::to_string(found.exitCode) : found.stderrText;
                while (!outcome.error.empty() && outcome.error.back() == '\n') outcome.error.pop_back();
            }
            for (const auto& m : GrepOutput::parse(found.stdoutText)) {
                if (total >= maxResults) break;
                outcome.lines.push_back(m.file + ":" + std::to_string(m.line) + ":" + m.content);
                ++total;
            }
        } catch (const WardenError& e) {
            outcome.ok = false;
            outcome.error = e.what();
        }

        if (!outcome.ok) {
            Logger::getInstance().warn("grep_search: " + root.string() + ": " + outcome.error);
        }
        outcomes.push_back(std::move(outcome));
    }

    return buildResult(outcomes, "\n");
}
