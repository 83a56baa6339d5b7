#include "utils/TextUtils.h"

namespace TextUtils {

namespace {
    bool isSpace(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    bool isContinuation(unsigned char c) {
        return (c & 0xC0) == 0x80;
    }
}

std::string normalizeLineEndings(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') continue;
        out.push_back(text[i]);
    }
    return out;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && isSpace(s[b])) ++b;
    size_t e = s.size();
    while (e > b && isSpace(s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string trimStart(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && isSpace(s[b])) ++b;
    return s.substr(b);
}

std::string leadingWhitespace(const std::string& s) {
    size_t n = 0;
    while (n < s.size() && isSpace(s[n])) ++n;
    return s.substr(0, n);
}

bool isBlank(const std::string& s) {
    for (char c : s) {
        if (!isSpace(c)) return false;
    }
    return true;
}

std::string sanitizeUtf8(const std::string& input) {
    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);

        if (c <= 0x7F) {
            output.push_back(static_cast<char>(c));
            ++i;
            continue;
        }
        // 孤立的续字节: 丢弃
        if (isContinuation(c)) {
            ++i;
            continue;
        }

        size_t len = 0;
        if (c >= 0xC2 && c <= 0xDF) len = 2;
        else if (c >= 0xE0 && c <= 0xEF) len = 3;
        else if (c >= 0xF0 && c <= 0xF4) len = 4;

        bool valid = len > 0 && i + len <= input.size();
        for (size_t k = 1; valid && k < len; ++k) {
            valid = isContinuation(static_cast<unsigned char>(input[i + k]));
        }
        if (valid && len >= 3) {
            unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
            // 过长编码 / 超出 Unicode 范围
            if ((c == 0xE0 && c1 < 0xA0) || (c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F)) {
                output.push_back('?');
                i += len;
                continue;
            }
        }

        if (valid) {
            output.append(input, i, len);
            i += len;
        } else {
            output.push_back('?');
            ++i;
        }
    }
    return output;
}

}
