/**
 * @file backup_time.hpp
 * @brief Timestamp helpers for archive naming and listing metadata.
 */

#ifndef BACKUP_TIME_HPP
#define BACKUP_TIME_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Formats a UTC instant for use in an archive filename.
 *
 * The ISO-8601 form is truncated to whole seconds and ':' is replaced by '-',
 * e.g. "2026-10-19T19-53-12".
 *
 * @param time Instant to format.
 * @return std::string Filename-safe timestamp.
 */
std::string archiveTimestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Builds the archive filename for a backup taken at the given instant.
 *
 * @param time Capture instant.
 * @param extension Archive extension without the leading dot (e.g. "zip").
 * @return std::string Filename of the form backup_<timestamp>_GMT.<extension>.
 */
std::string archiveFileName(std::chrono::system_clock::time_point time, std::string_view extension);

/**
 * @brief Formats an instant as ISO-8601 UTC with milliseconds ("...T19:53:12.345Z").
 */
std::string formatIso8601(std::chrono::system_clock::time_point time);

/**
 * @brief Parses an ISO-8601 instant as reported by the object storage service.
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with an optional fractional part and an
 * optional "Z" or "+HH:MM"/"-HH:MM" offset. A missing offset means UTC.
 *
 * @param text Text to parse.
 * @return std::optional<std::chrono::system_clock::time_point> The instant, or nullopt if malformed.
 */
std::optional<std::chrono::system_clock::time_point> parseIso8601(std::string_view text);

#endif // BACKUP_TIME_HPP
