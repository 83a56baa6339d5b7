#include "CoreTools.h"
#include "SearchTools.h"
#include "ToolRegistry.h"
#include "core/ConfigManager.h"
#include "core/Errors.h"
#include "edit/EditEngine.h"
#include "process/ProcessRunner.h"
#include "sandbox/PathResolver.h"
#include "utils/Logger.h"
#include "utils/TextUtils.h"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

// ============================================================================
// ReadFileTool Implementation
// ============================================================================

ReadFileTool::ReadFileTool(std::shared_ptr<const PathResolver> resolver)
    : resolver(std::move(resolver)) {}

std::string ReadFileTool::getDescription() const {
    return "Read the complete contents of a file. "
           "The path may be relative, absolute or ~-prefixed, and must lie within the allowed directories.";
}

nlohmann::json ReadFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Path of the file to read"}
            }}
        }},
        {"required", {"path"}}
    };
}

nlohmann::json ReadFileTool::execute(const nlohmann::json& args) {
    fs::path path = resolver->resolveExisting(args["path"].get<std::string>());

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        throw InvalidArguments("Path is a directory, use list_directory: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw NotFound("Cannot open file: " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    nlohmann::json result = makeTextResult(TextUtils::sanitizeUtf8(content));
    result["path"] = path.string();
    return result;
}

// ============================================================================
// ListDirectoryTool Implementation
// ============================================================================

ListDirectoryTool::ListDirectoryTool(std::shared_ptr<const PathResolver> resolver)
    : resolver(std::move(resolver)) {}

std::string ListDirectoryTool::getDescription() const {
    return "List the entries of a directory, one per line, prefixed with [DIR] or [FILE]. "
           "The directory must lie within the allowed directories.";
}

nlohmann::json ListDirectoryTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Directory to list"}
            }}
        }},
        {"required", {"path"}}
    };
}

nlohmann::json ListDirectoryTool::execute(const nlohmann::json& args) {
    fs::path dir = resolver->resolveDirectory(args["path"].get<std::string>());

    std::vector<std::pair<std::string, bool>> entries;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code statEc;
        bool isDir = fs::is_directory(it->symlink_status(statEc));
        entries.emplace_back(it->path().filename().string(), isDir);
    }
    if (ec) {
        throw ExecutionFailure("Cannot list directory " + dir.string() + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end());

    std::ostringstream text;
    nlohmann::json listing = nlohmann::json::array();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) text << "\n";
        text << (entries[i].second ? "[DIR] " : "[FILE] ") << entries[i].first;
        listing.push_back({{"name", entries[i].first}, {"type", entries[i].second ? "directory" : "file"}});
    }

    nlohmann::json result = makeTextResult(text.str());
    result["entries"] = listing;
    return result;
}

// ============================================================================
// SearchFilesTool Implementation
// ============================================================================

SearchFilesTool::SearchFilesTool(std::shared_ptr<const PathResolver> resolver,
                                 std::shared_ptr<IProcessRunner> runner,
                                 std::chrono::milliseconds timeout)
    : resolver(std::move(resolver)), runner(std::move(runner)), timeout(timeout) {}

std::string SearchFilesTool::getDescription() const {
    return "Recursively find files and directories whose name contains the given pattern, "
           "starting from a directory within the allowed directories. "
           "excludePatterns skips any path containing one of the given substrings.";
}

nlohmann::json SearchFilesTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Directory to start searching from"}
            }},
            {"pattern", {
                {"type", "string"},
                {"description", "Substring (find -name glob) the entry name must contain"}
            }},
            {"excludePatterns", {
                {"type", "array"},
                {"items", {{"type", "string"}}},
                {"description", "Path substrings to exclude (optional)"}
            }}
        }},
        {"required", {"path", "pattern"}}
    };
}

nlohmann::json SearchFilesTool::execute(const nlohmann::json& args) {
    fs::path dir = resolver->resolveDirectory(args["path"].get<std::string>());
    const std::string pattern = args["pattern"].get<std::string>();
    const auto excludes = args.value("excludePatterns", std::vector<std::string>{});

    std::vector<std::string> findArgs = {dir.string(), "-name", "*" + pattern + "*"};
    for (const auto& ex : excludes) {
        if (ex.empty()) continue;
        findArgs.insert(findArgs.end(), {"!", "-path", "*" + ex + "*"});
    }

    ProcessResult found = runner->run("find", findArgs, dir, timeout);
    requireSuccess(found, "Search");

    std::vector<std::string> files;
    std::istringstream iss(found.stdoutText);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty()) files.push_back(line);
    }

    std::string text;
    for (size_t i = 0; i < files.size(); ++i) {
        if (i > 0) text += "\n";
        text += files[i];
    }

    nlohmann::json result = makeTextResult(files.empty() ? "No matches found" : text);
    result["matches"] = files;
    return result;
}

// ============================================================================
// EditFileTool Implementation
// ============================================================================

EditFileTool::EditFileTool(std::shared_ptr<const PathResolver> resolver)
    : resolver(std::move(resolver)) {}

std::string EditFileTool::getDescription() const {
    return "Apply a sequence of text replacements to a file and return a git-style diff. "
           "Each oldText is matched exactly, or line by line ignoring leading/trailing whitespace "
           "(the replacement is re-indented to the matched location). Edits are applied in order; "
           "if any edit does not match, nothing is written. Use dryRun to preview.";
}

nlohmann::json EditFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "File to edit"}
            }},
            {"edits", {
                {"type", "array"},
                {"items", {
                    {"type", "object"},
                    {"properties", {
                        {"oldText", {{"type", "string"}, {"description", "Text to search for"}}},
                        {"newText", {{"type", "string"}, {"description", "Text to replace with"}}}
                    }},
                    {"required", {"oldText", "newText"}}
                }},
                {"description", "Replacements, applied in order"}
            }},
            {"dryRun", {
                {"type", "boolean"},
                {"description", "Preview changes using git-style diff format without writing (default: false)"}
            }}
        }},
        {"required", {"path", "edits"}}
    };
}

nlohmann::json EditFileTool::execute(const nlohmann::json& args) {
    fs::path path = resolver->resolveExisting(args["path"].get<std::string>());
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        throw InvalidArguments("Cannot edit a directory: " + path.string());
    }

    const auto edits = args["edits"].get<std::vector<EditOperation>>();
    const bool dryRun = args.value("dryRun", false);

    EditResult edit = EditEngine::applyToFile(path, edits, dryRun);

    nlohmann::json result = makeTextResult(edit.diff);
    result["path"] = path.string();
    result["dry_run"] = dryRun;
    return result;
}

// ============================================================================
// DeleteFileTool Implementation
// ============================================================================

DeleteFileTool::DeleteFileTool(std::shared_ptr<const PathResolver> resolver)
    : resolver(std::move(resolver)) {}

std::string DeleteFileTool::getDescription() const {
    return "Delete a file within the allowed directories. Directories are not deleted; "
           "a symbolic link is removed itself, not its target.";
}

nlohmann::json DeleteFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "File to delete"}
            }}
        }},
        {"required", {"path"}}
    };
}

nlohmann::json DeleteFileTool::execute(const nlohmann::json& args) {
    const std::string requested = args["path"].get<std::string>();
    fs::path real = resolver->resolveExisting(requested);

    // 路径本身是符号链接时删除链接, 不删除目标
    fs::path nominal = resolver->lexicalPath(requested);
    std::error_code ec;
    fs::path target = fs::is_symlink(fs::symlink_status(nominal, ec)) ? nominal : real;

    if (fs::is_directory(fs::symlink_status(target, ec))) {
        throw InvalidArguments("Refusing to delete a directory: " + target.string());
    }

    if (!fs::remove(target, ec) || ec) {
        throw ExecutionFailure("Failed to delete " + target.string() + (ec ? ": " + ec.message() : ""));
    }

    Logger::getInstance().success("Deleted " + target.string());
    nlohmann::json result = makeTextResult("Successfully deleted file " + requested);
    result["path"] = target.string();
    return result;
}

// ============================================================================
// RunTerminalCommandTool Implementation
// ============================================================================

RunTerminalCommandTool::RunTerminalCommandTool(std::shared_ptr<const PathResolver> resolver,
                                               std::shared_ptr<IProcessRunner> runner,
                                               std::chrono::milliseconds defaultTimeout)
    : resolver(std::move(resolver)), runner(std::move(runner)), defaultTimeout(defaultTimeout) {}

std::string RunTerminalCommandTool::getDescription() const {
    return "Execute a shell command (sh -c). The working directory defaults to the base allowed directory "
           "and must lie within the allowed directories. The command is terminated when the timeout "
           "(milliseconds, default " + std::to_string(defaultTimeout.count()) + ") expires.";
}

nlohmann::json RunTerminalCommandTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"command", {
                {"type", "string"},
                {"description", "Command to execute"}
            }},
            {"workingDirectory", {
                {"type", "string"},
                {"description", "Directory to run in (optional)"}
            }},
            {"timeout", {
                {"type", "integer"},
                {"description", "Timeout in milliseconds (default " + std::to_string(defaultTimeout.count()) + ")"}
            }}
        }},
        {"required", {"command"}}
    };
}

fs::path RunTerminalCommandTool::defaultWorkingDirectory() const {
    const BoundarySet& boundaries = resolver->boundaries();
    if (boundaries.contains(boundaries.baseDirectory())) {
        return boundaries.baseDirectory();
    }
    return boundaries.roots().front();
}

nlohmann::json RunTerminalCommandTool::execute(const nlohmann::json& args) {
    const std::string command = args["command"].get<std::string>();
    if (TextUtils::isBlank(command)) {
        throw InvalidArguments("command must be non-empty");
    }

    fs::path cwd = defaultWorkingDirectory();
    if (args.contains("workingDirectory") && args["workingDirectory"].is_string()) {
        cwd = resolver->resolveDirectory(args["workingDirectory"].get<std::string>());
    }

    long long timeoutMs = args.value("timeout", static_cast<long long>(defaultTimeout.count()));
    if (timeoutMs <= 0) {
        throw InvalidArguments("timeout must be a positive number of milliseconds");
    }
    if (timeoutMs > ProcessRunner::kMaxTimeout.count()) {
        throw InvalidArguments("timeout must not exceed " + std::to_string(ProcessRunner::kMaxTimeout.count()) +
                               " milliseconds");
    }

    Logger::getInstance().info("run_terminal_command in " + cwd.string() + ": " + command);

    ProcessResult run;
    try {
        run = runner->run("sh", {"-c", command}, cwd, std::chrono::milliseconds(timeoutMs));
    } catch (const TimeoutError& e) {
        std::string partial = e.partialOutput();
        if (!e.partialErrorOutput().empty()) partial += "\nSTDERR:\n" + e.partialErrorOutput();
        if (partial.empty()) throw;
        throw TimeoutError(std::string(e.what()) + "\nPartial output:\n" + partial,
                           e.partialOutput(), e.partialErrorOutput());
    }

    std::string output = run.stdoutText;
    if (!run.stderrText.empty()) output += "\nSTDERR:\n" + run.stderrText;

    if (run.exitCode != 0) {
        throw ExecutionFailure("Command failed with exit code " + std::to_string(run.exitCode) + ":\n" + output,
                               run.stdoutText, run.stderrText, run.exitCode);
    }

    nlohmann::json result = makeTextResult(output.empty() ? "Command completed successfully" : output);
    result["exit_code"] = run.exitCode;
    result["working_directory"] = cwd.string();
    return result;
}

// ============================================================================
// ListAllowedDirectoriesTool Implementation
// ============================================================================

ListAllowedDirectoriesTool::ListAllowedDirectoriesTool(std::shared_ptr<const PathResolver> resolver)
    : resolver(std::move(resolver)) {}

std::string ListAllowedDirectoriesTool::getDescription() const {
    return "List the directories this server is allowed to access. Every path argument of the other tools "
           "must resolve inside one of them.";
}

nlohmann::json ListAllowedDirectoriesTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", nlohmann::json::object()}
    };
}

nlohmann::json ListAllowedDirectoriesTool::execute(const nlohmann::json& /*args*/) {
    const auto& roots = resolver->boundaries().roots();
    std::string text = "Allowed directories:";
    nlohmann::json list = nlohmann::json::array();
    for (const auto& root : roots) {
        text += "\n" + root.string();
        list.push_back(root.string());
    }
    nlohmann::json result = makeTextResult(text);
    result["directories"] = list;
    return result;
}

// ============================================================================
// Registration
// ============================================================================

void registerBuiltinTools(ToolRegistry& registry,
                          std::shared_ptr<const PathResolver> resolver,
                          std::shared_ptr<IProcessRunner> runner,
                          const Config& config) {
    const std::chrono::milliseconds timeout(config.process.defaultTimeoutMs);

    registry.registerTool(std::make_unique<ReadFileTool>(resolver));
    registry.registerTool(std::make_unique<ListDirectoryTool>(resolver));
    registry.registerTool(std::make_unique<SearchFilesTool>(resolver, runner, timeout));
    registry.registerTool(std::make_unique<EditFileTool>(resolver));
    registry.registerTool(std::make_unique<DeleteFileTool>(resolver));
    registry.registerTool(std::make_unique<RunTerminalCommandTool>(resolver, runner, timeout));
    registry.registerTool(std::make_unique<ListAllowedDirectoriesTool>(resolver));
    registry.registerTool(std::make_unique<CodebaseSearchTool>(resolver, runner, timeout, config.search.codebaseMaxResults));
    registry.registerTool(std::make_unique<GrepSearchTool>(resolver, runner, timeout, config.search.grepMaxResults));
}
