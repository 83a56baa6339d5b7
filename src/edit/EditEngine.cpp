#include "edit/EditEngine.h"
#include "edit/UnifiedDiff.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include "utils/TextUtils.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unistd.h>

void from_json(const nlohmann::json& j, EditOperation& op) {
    op.oldText = j.at("oldText").get<std::string>();
    op.newText = j.at("newText").get<std::string>();
}

namespace {

// 匹配位置之前同一行上只有空白 (且非空): oldText 的前导空白落在了缩进里
bool startsInsideIndentation(const std::string& content, size_t pos) {
    size_t lineStart = content.rfind('\n', pos == 0 ? 0 : pos - 1);
    lineStart = (lineStart == std::string::npos || pos == 0) ? 0 : lineStart + 1;
    if (lineStart == pos) return false;
    return TextUtils::isBlank(content.substr(lineStart, pos - lineStart));
}

std::string preview(const std::string& text) {
    const size_t kMax = 200;
    if (text.size() <= kMax) return text;
    return text.substr(0, kMax) + "...";
}

}

std::vector<std::string> EditEngine::reindent(const std::vector<std::string>& oldLines,
                                              const std::vector<std::string>& newLines,
                                              const std::string& baseIndent) {
    std::vector<std::string> out;
    out.reserve(newLines.size());
    for (size_t j = 0; j < newLines.size(); ++j) {
        const std::string& line = newLines[j];
        if (j == 0) {
            out.push_back(baseIndent + TextUtils::trimStart(line));
            continue;
        }
        std::string oldIndent = j < oldLines.size() ? TextUtils::leadingWhitespace(oldLines[j]) : "";
        std::string newIndent = TextUtils::leadingWhitespace(line);
        if (!oldIndent.empty() && !newIndent.empty()) {
            long delta = static_cast<long>(newIndent.size()) - static_cast<long>(oldIndent.size());
            out.push_back(baseIndent + std::string(static_cast<size_t>(std::max(0L, delta)), ' ') +
                          TextUtils::trimStart(line));
        } else {
            out.push_back(line);
        }
    }
    return out;
}

bool EditEngine::tryLineWindow(std::string& content, const std::string& oldText, const std::string& newText,
                               size_t onlyLine) {
    const auto oldLines = TextUtils::splitLines(oldText);
    auto contentLines = TextUtils::splitLines(content);
    if (oldLines.size() > contentLines.size()) return false;

    std::vector<std::string> trimmedOld;
    trimmedOld.reserve(oldLines.size());
    for (const auto& l : oldLines) trimmedOld.push_back(TextUtils::trim(l));

    const bool anchored = onlyLine != std::string::npos;
    for (size_t i = anchored ? onlyLine : 0; i + oldLines.size() <= contentLines.size(); ++i) {
        bool match = true;
        for (size_t j = 0; j < oldLines.size() && match; ++j) {
            match = TextUtils::trim(contentLines[i + j]) == trimmedOld[j];
        }
        if (!match) {
            if (anchored) return false;
            continue;
        }

        const std::string baseIndent = TextUtils::leadingWhitespace(contentLines[i]);
        auto replacement = reindent(oldLines, TextUtils::splitLines(newText), baseIndent);

        contentLines.erase(contentLines.begin() + static_cast<long>(i),
                           contentLines.begin() + static_cast<long>(i + oldLines.size()));
        contentLines.insert(contentLines.begin() + static_cast<long>(i), replacement.begin(), replacement.end());
        content = TextUtils::joinLines(contentLines);
        return true;
    }
    return false;
}

std::string EditEngine::applyOne(const std::string& content, const EditOperation& edit) {
    const std::string oldText = TextUtils::normalizeLineEndings(edit.oldText);
    const std::string newText = TextUtils::normalizeLineEndings(edit.newText);

    if (oldText.empty()) {
        if (content.empty()) return newText;
        throw EditConflict("Could not apply edit: oldText is empty and the file is not empty", edit.oldText);
    }

    const size_t pos = content.find(oldText);
    const bool indentationDrift = pos != std::string::npos &&
                                  !TextUtils::leadingWhitespace(oldText).empty() &&
                                  startsInsideIndentation(content, pos);

    if (pos != std::string::npos && !indentationDrift) {
        std::string result = content;
        result.replace(pos, oldText.size(), newText);
        return result;
    }

    // 缩进漂移时只看逐字匹配所在的那一行, 不能改到更早的行
    const size_t anchorLine = indentationDrift
        ? static_cast<size_t>(std::count(content.begin(), content.begin() + static_cast<long>(pos), '\n'))
        : std::string::npos;

    std::string result = content;
    if (tryLineWindow(result, oldText, newText, anchorLine)) {
        return result;
    }

    if (pos != std::string::npos) {
        result = content;
        result.replace(pos, oldText.size(), newText);
        return result;
    }

    throw EditConflict("Could not find exact match for edit:\n" + preview(edit.oldText), edit.oldText);
}

EditResult EditEngine::applyEdits(const std::string& originalText,
                                  const std::vector<EditOperation>& edits,
                                  const std::string& label) {
    EditResult result;
    result.originalContent = TextUtils::normalizeLineEndings(originalText);

    std::string modified = result.originalContent;
    for (size_t i = 0; i < edits.size(); ++i) {
        try {
            modified = applyOne(modified, edits[i]);
        } catch (const EditConflict& e) {
            Logger::getInstance().warn("edit " + std::to_string(i + 1) + "/" + std::to_string(edits.size()) +
                                       " on " + label + " did not match");
            throw;
        }
    }

    result.newContent = std::move(modified);
    result.diff = UnifiedDiff::fence(UnifiedDiff::create(result.originalContent, result.newContent, label));
    return result;
}

void EditEngine::writeAtomically(const fs::path& path, const std::string& content) {
    // 每次写入用独立的同目录临时文件, 并发编辑同一文件时互不覆盖
    std::string pattern = path.string() + ".warden.XXXXXX";
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');
    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        throw ExecutionFailure("Cannot write file: " + path.string() + ": " + std::strerror(errno));
    }
    const fs::path tmp(name.data());

    const char* data = content.data();
    size_t left = content.size();
    bool ok = true;
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            ok = false;
            break;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    if (::close(fd) != 0) ok = false;
    if (!ok) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw ExecutionFailure("Failed to write file: " + path.string());
    }

    std::error_code ec;
    auto perms = fs::status(path, ec).permissions();
    if (!ec) fs::permissions(tmp, perms, ec);

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw ExecutionFailure("Failed to replace file " + path.string() + ": " + ec.message());
    }
}

EditResult EditEngine::applyToFile(const fs::path& path,
                                   const std::vector<EditOperation>& edits,
                                   bool dryRun) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw NotFound("Cannot open file for reading: " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    in.close();

    EditResult result = applyEdits(buffer.str(), edits, path.string());

    if (!dryRun) {
        writeAtomically(path, result.newContent);
        Logger::getInstance().success("Edited " + path.string() + " (" + std::to_string(edits.size()) + " edit(s))");
    } else {
        Logger::getInstance().debug("Dry run on " + path.string());
    }
    return result;
}
