#include "edit/UnifiedDiff.h"
#include <algorithm>
#include <unordered_map>

std::vector<std::string> UnifiedDiff::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            tokens.push_back(text.substr(start));
            break;
        }
        tokens.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return tokens;
}

// Myers O(ND) in linear space: strip the common ends, split on the middle snake, recurse.
std::vector<UnifiedDiff::Edit> UnifiedDiff::computeEdits(const std::vector<std::string>& a,
                                                         const std::vector<std::string>& b) {
    // 行内容映射为整数 id, 比较只需比 id
    std::unordered_map<std::string, int> ids;
    auto intern = [&ids](const std::vector<std::string>& lines) {
        std::vector<int> out;
        out.reserve(lines.size());
        for (const auto& line : lines) {
            out.push_back(ids.emplace(line, static_cast<int>(ids.size())).first->second);
        }
        return out;
    };
    const std::vector<int> ia = intern(a);
    const std::vector<int> ib = intern(b);

    std::vector<Edit> edits;
    edits.reserve(a.size() + b.size());
    diffRange(ia, 0, static_cast<long>(ia.size()), ib, 0, static_cast<long>(ib.size()), edits);
    groupChanges(edits);
    return edits;
}

void UnifiedDiff::diffRange(const std::vector<int>& a, long aLo, long aHi,
                            const std::vector<int>& b, long bLo, long bHi,
                            std::vector<Edit>& out) {
    while (aLo < aHi && bLo < bHi && a[aLo] == b[bLo]) {
        out.push_back({Op::Equal, static_cast<size_t>(aLo), static_cast<size_t>(bLo)});
        ++aLo;
        ++bLo;
    }
    long suffix = 0;
    while (aLo < aHi - suffix && bLo < bHi - suffix && a[aHi - 1 - suffix] == b[bHi - 1 - suffix]) {
        ++suffix;
    }
    aHi -= suffix;
    bHi -= suffix;

    long splitX = 0;
    long splitY = 0;
    const bool split = aLo < aHi && bLo < bHi &&
                       findMiddleSnake(a, aLo, aHi, b, bLo, bHi, splitX, splitY) &&
                       !(splitX == aLo && splitY == bLo) && !(splitX == aHi && splitY == bHi);
    if (split) {
        diffRange(a, aLo, splitX, b, bLo, splitY, out);
        diffRange(a, splitX, aHi, b, splitY, bHi, out);
    } else {
        for (long x = aLo; x < aHi; ++x) {
            out.push_back({Op::Delete, static_cast<size_t>(x), static_cast<size_t>(bLo)});
        }
        for (long y = bLo; y < bHi; ++y) {
            out.push_back({Op::Insert, static_cast<size_t>(aHi), static_cast<size_t>(y)});
        }
    }

    for (long i = 0; i < suffix; ++i) {
        out.push_back({Op::Equal, static_cast<size_t>(aHi + i), static_cast<size_t>(bHi + i)});
    }
}

bool UnifiedDiff::findMiddleSnake(const std::vector<int>& a, long aLo, long aHi,
                                  const std::vector<int>& b, long bLo, long bHi,
                                  long& splitX, long& splitY) {
    const long n = aHi - aLo;
    const long m = bHi - bLo;
    const long maxD = (n + m + 1) / 2;
    const long offset = maxD;
    const long size = 2 * maxD + 2;
    // forward[k]: 正向第 k 条对角线走到的最远 x; reverse 从两端末尾往回走
    std::vector<long> forward(static_cast<size_t>(size), -1);
    std::vector<long> reverse(static_cast<size_t>(size), -1);
    forward[offset + 1] = 0;
    reverse[offset + 1] = 0;

    const long delta = n - m;
    const bool checkOnForward = (delta % 2 != 0);
    long k1Start = 0, k1End = 0, k2Start = 0, k2End = 0;

    for (long d = 0; d < maxD; ++d) {
        for (long k1 = -d + k1Start; k1 <= d - k1End; k1 += 2) {
            const long k1Offset = offset + k1;
            long x1;
            if (k1 == -d || (k1 != d && forward[k1Offset - 1] < forward[k1Offset + 1])) {
                x1 = forward[k1Offset + 1];
            } else {
                x1 = forward[k1Offset - 1] + 1;
            }
            long y1 = x1 - k1;
            while (x1 < n && y1 < m && a[aLo + x1] == b[bLo + y1]) {
                ++x1;
                ++y1;
            }
            forward[k1Offset] = x1;
            if (x1 > n) {
                k1End += 2;
            } else if (y1 > m) {
                k1Start += 2;
            } else if (checkOnForward) {
                const long k2Offset = offset + delta - k1;
                if (k2Offset >= 0 && k2Offset < size && reverse[k2Offset] != -1 &&
                    x1 >= n - reverse[k2Offset]) {
                    splitX = aLo + x1;
                    splitY = bLo + y1;
                    return true;
                }
            }
        }

        for (long k2 = -d + k2Start; k2 <= d - k2End; k2 += 2) {
            const long k2Offset = offset + k2;
            long x2;
            if (k2 == -d || (k2 != d && reverse[k2Offset - 1] < reverse[k2Offset + 1])) {
                x2 = reverse[k2Offset + 1];
            } else {
                x2 = reverse[k2Offset - 1] + 1;
            }
            long y2 = x2 - k2;
            while (x2 < n && y2 < m && a[aLo + n - x2 - 1] == b[bLo + m - y2 - 1]) {
                ++x2;
                ++y2;
            }
            reverse[k2Offset] = x2;
            if (x2 > n) {
                k2End += 2;
            } else if (y2 > m) {
                k2Start += 2;
            } else if (!checkOnForward) {
                const long k1Offset = offset + delta - k2;
                if (k1Offset >= 0 && k1Offset < size && forward[k1Offset] != -1) {
                    const long x1 = forward[k1Offset];
                    const long y1 = offset + x1 - k1Offset;
                    if (x1 <= n && y1 >= 0 && y1 <= m && x1 >= n - x2) {
                        splitX = aLo + x1;
                        splitY = bLo + y1;
                        return true;
                    }
                }
            }
        }
    }
    return false;
}

// 连续的改动块内删除行排在插入行之前, 并按此顺序修正另一侧的位置
void UnifiedDiff::groupChanges(std::vector<Edit>& edits) {
    size_t x = 0;
    size_t y = 0;
    size_t i = 0;
    while (i < edits.size()) {
        if (edits[i].op == Op::Equal) {
            x = edits[i].oldIndex + 1;
            y = edits[i].newIndex + 1;
            ++i;
            continue;
        }
        size_t end = i;
        while (end < edits.size() && edits[end].op != Op::Equal) ++end;

        std::vector<Edit> deletes;
        std::vector<Edit> inserts;
        for (size_t j = i; j < end; ++j) {
            (edits[j].op == Op::Delete ? deletes : inserts).push_back(edits[j]);
        }
        size_t j = i;
        for (Edit e : deletes) {
            e.newIndex = y;
            edits[j++] = e;
        }
        for (Edit e : inserts) {
            e.oldIndex = x + deletes.size();
            edits[j++] = e;
        }
        x += deletes.size();
        y += inserts.size();
        i = end;
    }
}

void UnifiedDiff::appendLine(std::vector<std::string>& out, char prefix, const std::string& token) {
    if (!token.empty() && token.back() == '\n') {
        out.push_back(std::string(1, prefix) + token.substr(0, token.size() - 1));
    } else {
        out.push_back(std::string(1, prefix) + token);
        out.push_back("\\ No newline at end of file");
    }
}

std::vector<UnifiedDiff::DiffHunk> UnifiedDiff::buildHunks(const std::vector<Edit>& edits,
                                                           const std::vector<std::string>& a,
                                                           const std::vector<std::string>& b,
                                                           int contextLines) {
    std::vector<DiffHunk> hunks;
    const size_t ctx = static_cast<size_t>(std::max(0, contextLines));

    size_t i = 0;
    while (i < edits.size()) {
        // Skip to next change
        while (i < edits.size() && edits[i].op == Op::Equal) ++i;
        if (i >= edits.size()) break;

        size_t begin = i >= ctx ? i - ctx : 0;
        // Extend the hunk while the gap of equal lines between changes is <= 2 * ctx
        size_t end = i;
        while (end < edits.size()) {
            while (end < edits.size() && edits[end].op != Op::Equal) ++end;
            size_t eq = end;
            while (eq < edits.size() && edits[eq].op == Op::Equal) ++eq;
            if (eq < edits.size() && eq - end <= 2 * ctx) {
                end = eq;
                continue;
            }
            end = std::min(edits.size(), end + ctx);
            break;
        }

        DiffHunk h{};
        const Edit& first = edits[begin];
        h.oldStart = first.oldIndex;
        h.newStart = first.newIndex;
        for (size_t j = begin; j < end; ++j) {
            const Edit& e = edits[j];
            switch (e.op) {
                case Op::Equal:
                    appendLine(h.lines, ' ', a[e.oldIndex]);
                    ++h.oldCount;
                    ++h.newCount;
                    break;
                case Op::Delete:
                    appendLine(h.lines, '-', a[e.oldIndex]);
                    ++h.oldCount;
                    break;
                case Op::Insert:
                    appendLine(h.lines, '+', b[e.newIndex]);
                    ++h.newCount;
                    break;
            }
        }
        // 1-based; an empty side points at the line before the hunk
        h.oldStart = h.oldCount == 0 ? h.oldStart : h.oldStart + 1;
        h.newStart = h.newCount == 0 ? h.newStart : h.newStart + 1;
        hunks.push_back(std::move(h));
        i = end;
    }
    return hunks;
}

std::string UnifiedDiff::create(const std::string& original,
                                const std::string& modified,
                                const std::string& label,
                                int contextLines) {
    const auto a = tokenize(original);
    const auto b = tokenize(modified);

    std::string out;
    out += "Index: " + label + "\n";
    out += "===================================================================\n";
    out += "--- " + label + "\toriginal\n";
    out += "+++ " + label + "\tmodified\n";

    for (const auto& h : buildHunks(computeEdits(a, b), a, b, contextLines)) {
        out += "@@ -" + std::to_string(h.oldStart) + "," + std::to_string(h.oldCount) +
               " +" + std::to_string(h.newStart) + "," + std::to_string(h.newCount) + " @@\n";
        for (const auto& line : h.lines) {
            out += line;
            out += '\n';
        }
    }
    return out;
}

std::string UnifiedDiff::fence(const std::string& diff) {
    size_t longest = 0;
    size_t run = 0;
    for (char c : diff) {
        run = (c == '`') ? run + 1 : 0;
        longest = std::max(longest, run);
    }
    const std::string ticks(std::max<size_t>(3, longest + 1), '`');

    std::string body = diff;
    if (!body.empty() && body.back() != '\n') body += '\n';
    return ticks + "diff\n" + body + ticks + "\n\n";
}
