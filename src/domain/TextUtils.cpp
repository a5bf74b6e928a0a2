#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cctype>

namespace notestamp::domain::text {

namespace {
    const char* kWhitespace = " \t\n\r\f\v";
}

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

bool IsAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

std::string TrimEnd(const std::string& s) {
    size_t last = s.find_last_not_of(kWhitespace);
    if (last == std::string::npos) return "";
    return s.substr(0, last + 1);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool ReadDigits(const std::string& s, std::size_t& pos, std::size_t minCount, std::size_t maxCount, int& out) {
    size_t end = pos;
    int value = 0;
    while (end < s.size() && end - pos < maxCount && IsDigit(s[end])) {
        value = value * 10 + (s[end] - '0');
        ++end;
    }
    if (end - pos < minCount) return false;
    out = value;
    pos = end;
    return true;
}

std::vector<std::string> SplitLines(const std::string& s) {
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') continue;
        if (s[i] == '\n') {
            lines.push_back(current);
            current.clear();
        } else {
            current += s[i];
        }
    }
    lines.push_back(current);
    return lines;
}

std::string JoinWithNewline(const std::string& head, const std::string& tail) {
    if (head.empty()) return tail;
    return head + "\n" + tail;
}

} // namespace notestamp::domain::text
