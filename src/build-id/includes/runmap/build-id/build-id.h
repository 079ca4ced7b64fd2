#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace runmap::build_id {

/**
 * Layout of a build directory name: `yyyy-MM-dd_HH-mm-ss` (UTC).
 */
inline constexpr std::string_view FORMAT = "yyyy-MM-dd_HH-mm-ss";
inline constexpr std::size_t ID_LENGTH = FORMAT.size();

/**
 * Parse a build id into seconds since the Unix epoch.
 *
 * Parsing is lenient about calendar values in the same way a lenient date
 * parser is: each field is 1 to 4 digits, and out-of-range values roll over
 * into the neighbouring unit (month 13 is January of the next year, day 0 is
 * the last day of the previous month). Structural problems, such as missing
 * separators, non-digits or trailing characters, make the parse fail.
 *
 * @param id Candidate directory name
 * @return Seconds since epoch, or nullopt if the text is not parseable
 */
std::optional<std::int64_t>
parse(std::string_view id);

/**
 * Encode seconds since the Unix epoch as a build id.
 *
 * Years outside 0000..9999 produce text that parse() does not accept
 * back, so they never round-trip.
 */
std::string
format(std::int64_t epoch_seconds);

/**
 * True when `format(parse(id)) == id`.
 *
 * Only canonical ids are trusted as build directories: lenient parsing
 * would otherwise map impossible dates such as February 30th onto a
 * different instant than the one the name claims.
 */
[[nodiscard]] bool
is_canonical(std::string_view id);

}  // namespace runmap::build_id
