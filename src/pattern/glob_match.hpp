/* SPDX-License-Identifier: MPL-2.0 */
/* Moenster - Glob pattern matching */

#ifndef MST_GLOB_MATCH_HPP_INCLUDED
#define MST_GLOB_MATCH_HPP_INCLUDED

#include <cstddef>
#include <span>
#include <string>
#include <moenster/moenster_export.h>

namespace mst
{
// Read-only view into a pattern or a subject
using byte_view_t = std::span<const unsigned char>;

enum class case_mode_t
{
    sensitive,
    insensitive // ASCII letters only, bytes >= 0x80 never fold
};

// Anchored glob match of subject against pattern
// Supports:
//   * - matches any run of bytes, including none
//   ? - matches exactly one byte
//   [abc] - matches one byte from the set
//   [a-z] - matches one byte from the range, reversed ends are swapped
//   [^abc] - matches one byte not in the set
//   \x - escapes special characters, also inside [...]
//
// The pattern is interpreted from scratch on each call; nothing is
// compiled or cached. Every input pair is valid and the call never
// fails, malformed patterns are matched by fixed rules:
//   - an unterminated [... uses the members seen up to the end
//   - an empty [] or [^] never matches
//   - a trailing \ is a literal backslash
//
// Pure and re-entrant. Runs in O(pattern size * subject size) time
// without recursion or heap allocation.
MST_EXPORT bool glob_match (byte_view_t pattern,
                            byte_view_t subject,
                            case_mode_t mode = case_mode_t::sensitive) noexcept;

MST_EXPORT bool glob_match (const unsigned char *pattern,
                            size_t pattern_size,
                            const unsigned char *subject,
                            size_t subject_size,
                            case_mode_t mode = case_mode_t::sensitive) noexcept;

MST_EXPORT bool glob_match (const std::string &pattern,
                            const std::string &subject,
                            case_mode_t mode = case_mode_t::sensitive) noexcept;

// NUL-terminated strings
MST_EXPORT bool glob_match (const char *pattern,
                            const char *subject,
                            case_mode_t mode = case_mode_t::sensitive) noexcept;

}

#endif
