// =============================================================================
// FILE: src/live/version_info.cpp
// =============================================================================
#include "live/version_info.h"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <regex>

namespace asterisk_live {

namespace {

// Whole segment must be an optionally negative decimal that fits in int
int segment_value(const std::string& segment) {
    size_t digits = (!segment.empty() && segment[0] == '-') ? 1 : 0;
    if (digits == segment.size()) return 0;
    for (size_t i = digits; i < segment.size(); ++i)
        if (segment[i] < '0' || segment[i] > '9') return 0;

    errno = 0;
    char* end = nullptr;
    long v = std::strtol(segment.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0' || v < INT_MIN || v > INT_MAX) return 0;
    return static_cast<int>(v);
}

} // namespace

std::vector<int> parse_revision(const std::string& revision) {
    std::vector<int> out;
    size_t start = 0;
    while (true) {
        size_t dot = revision.find('.', start);
        std::string segment = revision.substr(start, dot == std::string::npos
                                                     ? std::string::npos : dot - start);
        out.push_back(segment_value(segment));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return out;
}

std::map<std::string, std::string> parse_version_files(const std::vector<std::string>& lines) {
    static const std::regex row(R"(^(\S+)\s+Revision:\s+(\S+))");

    std::map<std::string, std::string> out;
    for (size_t i = kVersionFilesHeaderLines; i < lines.size(); ++i) {
        std::smatch m;
        if (std::regex_search(lines[i], m, row)) out[m[1].str()] = m[2].str();
    }
    return out;
}

} // namespace asterisk_live
