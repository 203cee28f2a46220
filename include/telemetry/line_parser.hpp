#pragma once

#include <map>
#include <string>
#include <vector>

/** @brief Strip leading/trailing whitespace (space, tab, CR, LF, VT, FF). */
std::string trim(const std::string& s);

/** @brief True if text begins with prefix (case sensitive). */
bool startsWith(const std::string& text, const std::string& prefix);

/** @brief Split string by delimiter into parts (empty fields kept). */
std::vector<std::string> split(const std::string& line, char delim);

/** @brief Split on runs of whitespace, dropping empty tokens. */
std::vector<std::string> splitWhitespace(const std::string& line);

/** @brief Parse a whole (trimmed) decimal integer; false on junk or overflow. */
bool parseIntStrict(const std::string& s, int& out);

/** @brief Parse a whole (trimmed) finite real number; false on junk, inf or nan. */
bool parseRealStrict(const std::string& s, double& out);

/** @brief Parse a real and truncate it toward zero, e.g. "12.9" -> 12. */
bool parseIntTruncated(const std::string& s, int& out);

/**
 * @brief Parse space separated key=value tokens.
 *
 * Every token must contain exactly one '='. On failure @p out is left
 * untouched so callers can drop the whole line.
 */
bool parseKeyValueTokens(const std::vector<std::string>& tokens,
                         std::map<std::string, std::string>& out);

/** @brief Text after the first ':' of a "Label: value" line, trimmed. */
bool valueAfterColon(const std::string& line, std::string& out);
