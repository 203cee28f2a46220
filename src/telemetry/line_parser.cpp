#include "telemetry/line_parser.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace {
const char* kWhitespace = " \t\r\n\v\f";
} // namespace

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(kWhitespace);
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(kWhitespace);
    return s.substr(b, e - b + 1);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, delim)) {
        parts.push_back(item);
    }
    // getline drops a trailing empty field; keep it so "a:" has two parts.
    if (!line.empty() && line.back() == delim) {
        parts.emplace_back();
    }
    return parts;
}

std::vector<std::string> splitWhitespace(const std::string& line) {
    std::vector<std::string> parts;
    std::istringstream ss(line);
    std::string item;
    while (ss >> item) {
        parts.push_back(item);
    }
    return parts;
}

bool parseIntStrict(const std::string& s, int& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long val = std::strtol(t.c_str(), &end, 10);
    if (errno == ERANGE || end != t.c_str() + t.size()) return false;
    if (val < INT_MIN || val > INT_MAX) return false;
    out = static_cast<int>(val);
    return true;
}

bool parseRealStrict(const std::string& s, double& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double val = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) return false;
    if (!std::isfinite(val)) return false;
    out = val;
    return true;
}

bool parseIntTruncated(const std::string& s, int& out) {
    double val = 0.0;
    if (!parseRealStrict(s, val)) return false;
    double truncated = std::trunc(val);
    if (truncated < static_cast<double>(INT_MIN) || truncated > static_cast<double>(INT_MAX)) {
        return false;
    }
    out = static_cast<int>(truncated);
    return true;
}

bool parseKeyValueTokens(const std::vector<std::string>& tokens,
                         std::map<std::string, std::string>& out) {
    std::map<std::string, std::string> parsed;
    for (const auto& token : tokens) {
        auto pos = token.find('=');
        if (pos == std::string::npos || token.find('=', pos + 1) != std::string::npos) {
            return false;
        }
        parsed[token.substr(0, pos)] = token.substr(pos + 1);
    }
    out = std::move(parsed);
    return true;
}

bool valueAfterColon(const std::string& line, std::string& out) {
    auto parts = split(line, ':');
    if (parts.size() < 2) return false;
    out = trim(parts[1]);
    return true;
}
