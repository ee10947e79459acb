/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Env record - KEY=VALUE text format used by the deployment record
 *
 * Format rules:
 * - One record per line, `KEY=VALUE`, key anchored at the start of the line
 * - Blank lines, `#` comments and lines without `=` never match a key
 * - First matching line wins on lookup
 * - One pair of matching surrounding quotes ("..." or '...') is stripped on read
 * - A trailing carriage return is not part of the value
 */

#ifndef BGCTL_STORE_ENV_RECORD_HPP
#define BGCTL_STORE_ENV_RECORD_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace bgctl::store {

/**
 * Strip one pair of matching surrounding quote characters
 */
std::string strip_quotes(std::string_view value);

/**
 * Encode a value so that strip_quotes() gives it back unchanged.
 * Values whose first and last characters are the same quote character are
 * wrapped in the other quote character; everything else is written raw.
 */
std::string encode_value(std::string_view value);

/**
 * Look up the first `key=` line and return its decoded value
 */
std::optional<std::string> lookup(std::string_view content, std::string_view key);

/**
 * Replace the value of the first `key=` line, preserving every other line,
 * their order and the original line endings.
 * @return new content, or std::nullopt if the key is absent
 */
std::optional<std::string> replace_value(std::string_view content,
                                         std::string_view key,
                                         std::string_view value);

/**
 * Parse every record into a map (first occurrence of a key wins)
 */
std::map<std::string, std::string> parse_record(std::string_view content);

/**
 * Keys must be non-empty and free of '=', whitespace and control characters
 */
bool is_valid_key(std::string_view key);

} // namespace bgctl::store

#endif // BGCTL_STORE_ENV_RECORD_HPP
