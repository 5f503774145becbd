/* SPDX-License-Identifier: MPL-2.0 */
/* Moenster - Glob pattern matching */

#include "glob_match.hpp"
#include "../util/config.hpp"
#include "../util/err.hpp"
#include "../util/macros.hpp"
#include <cstring>

namespace
{
using mst::byte_view_t;
using mst::case_mode_t;

inline unsigned char fold (unsigned char ch, case_mode_t mode)
{
    if (mode == case_mode_t::insensitive && ch >= 'A' && ch <= 'Z')
        return static_cast<unsigned char> (ch - 'A' + 'a');
    return ch;
}

// Result of scanning one bracket class
struct class_result_t
{
    bool matched;
    // Pattern bytes taken by the class, closing ']' included if present
    size_t length;
};

// Scans the class that starts with '[' at pattern[0] and tests ch
// against it.
class_result_t match_class (byte_view_t pattern,
                            unsigned char ch,
                            case_mode_t mode)
{
    size_t pos = 1; // Skip '['
    bool negate = false;
    if (pos < pattern.size () && pattern[pos] == mst::class_negate_char) {
        negate = true;
        ++pos;
    }

    const unsigned char subject_ch = fold (ch, mode);
    bool any_member = false;
    bool matched = false;

    while (pos < pattern.size () && pattern[pos] != ']') {
        unsigned char low = pattern[pos];
        if (low == mst::escape_char && pos + 1 < pattern.size ())
            low = pattern[++pos];
        ++pos;
        any_member = true;

        // A '-' directly before the closing ']' is a plain member
        if (pos + 1 < pattern.size () && pattern[pos] == mst::class_range_char
            && pattern[pos + 1] != ']') {
            size_t high_pos = pos + 1;
            if (pattern[high_pos] == mst::escape_char
                && high_pos + 1 < pattern.size ())
                ++high_pos;
            unsigned char first = fold (low, mode);
            unsigned char last = fold (pattern[high_pos], mode);
            if (first > last) {
                const unsigned char tmp = first;
                first = last;
                last = tmp;
            }
            if (subject_ch >= first && subject_ch <= last)
                matched = true;
            pos = high_pos + 1;
        } else if (fold (low, mode) == subject_ch) {
            matched = true;
        }
    }

    // Take the closing ']' unless the class ran off the pattern
    if (pos < pattern.size ())
        ++pos;

    class_result_t result;
    result.matched = any_member && (matched != negate);
    result.length = pos;
    return result;
}

// Pattern bytes taken by the token at pattern[0] when it accepts ch,
// 0 when it rejects ch or the pattern is exhausted. Every token other
// than '*' accepts exactly one subject byte.
size_t match_token (byte_view_t pattern, unsigned char ch, case_mode_t mode)
{
    if (pattern.empty ())
        return 0;

    switch (pattern[0]) {
    case '?':
        return 1;

    case '[': {
        const class_result_t cls = match_class (pattern, ch, mode);
        MST_DEBUG_LOG ("mst: class of %zu bytes %s 0x%02x\n", cls.length,
                       cls.matched ? "matched" : "rejected", ch);
        return cls.matched ? cls.length : 0;
    }

    default: {
        size_t pos = 0;
        if (pattern[0] == mst::escape_char && pattern.size () >= 2)
            pos = 1;
        return fold (pattern[pos], mode) == fold (ch, mode) ? pos + 1 : 0;
    }
    }
}

// Only the most recent '*' is ever retried: what follows it consumes a
// fixed number of subject bytes, so letting an earlier '*' take more
// can not succeed where the latest one failed. Worst case is
// O(pattern size * subject size), without recursion or allocation.
bool match_impl (byte_view_t pattern, byte_view_t subject, case_mode_t mode)
{
    size_t p = 0;
    size_t s = 0;

    // Pattern offset after the latest '*' and the subject offset its
    // current trial resumes at
    bool have_star = false;
    size_t star_p = 0;
    size_t star_s = 0;

    while (s < subject.size ()) {
        if (p < pattern.size () && pattern[p] == '*') {
            if constexpr (mst::coalesce_stars) {
                while (p + 1 < pattern.size () && pattern[p + 1] == '*')
                    ++p;
            }
            // A final '*' takes whatever is left
            if (p + 1 == pattern.size ())
                return true;

            have_star = true;
            star_p = ++p;
            star_s = s;
            continue;
        }

        const size_t consumed =
          match_token (pattern.subspan (p), subject[s], mode);
        if (consumed != 0) {
            // Never step past the end, also for an unterminated class
            mst_assert (consumed <= pattern.size () - p);
            p += consumed;
            ++s;
            continue;
        }

        if (!have_star)
            return false;

        // Let the latest '*' take one more byte and retry from there
        p = star_p;
        s = ++star_s;
        MST_DEBUG_LOG ("mst: '*' trial, %zu pattern bytes vs %zu "
                       "subject bytes\n",
                       pattern.size () - p, subject.size () - s);
    }

    // Trailing stars still match an exhausted subject
    while (p < pattern.size () && pattern[p] == '*')
        ++p;

    return p == pattern.size ();
}
}

bool mst::glob_match (byte_view_t pattern,
                      byte_view_t subject,
                      case_mode_t mode) noexcept
{
    return match_impl (pattern, subject, mode);
}

bool mst::glob_match (const unsigned char *pattern,
                      size_t pattern_size,
                      const unsigned char *subject,
                      size_t subject_size,
                      case_mode_t mode) noexcept
{
    return match_impl (byte_view_t (pattern, pattern_size),
                       byte_view_t (subject, subject_size), mode);
}

bool mst::glob_match (const std::string &pattern,
                      const std::string &subject,
                      case_mode_t mode) noexcept
{
    return glob_match (
      reinterpret_cast<const unsigned char *> (pattern.data ()), pattern.size (),
      reinterpret_cast<const unsigned char *> (subject.data ()), subject.size (),
      mode);
}

bool mst::glob_match (const char *pattern,
                      const char *subject,
                      case_mode_t mode) noexcept
{
    return glob_match (reinterpret_cast<const unsigned char *> (pattern),
                       strlen (pattern),
                       reinterpret_cast<const unsigned char *> (subject),
                       strlen (subject), mode);
}
