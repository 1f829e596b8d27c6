// =============================================================================
// FILE: include/live/version_info.h
// =============================================================================
#ifndef LIVE_VERSION_INFO_H
#define LIVE_VERSION_INFO_H

#include <map>
#include <string>
#include <vector>

namespace asterisk_live {

// Output lines of "show version files" before the first data row
constexpr size_t kVersionFilesHeaderLines = 2;

// "1.2.x" -> {1, 2, 0}. One element per dot-separated segment; a segment
// without a leading number becomes 0.
std::vector<int> parse_revision(const std::string& revision);

// Rows "<file><ws>Revision: <rev>" from line kVersionFilesHeaderLines on.
// Lines that do not match are skipped.
std::map<std::string, std::string> parse_version_files(const std::vector<std::string>& lines);

} // namespace asterisk_live
#endif // LIVE_VERSION_INFO_H
