/* SPDX-License-Identifier: MPL-2.0 */
/* Moenster - Compile-time matcher settings */

#ifndef MST_CONFIG_HPP_INCLUDED
#define MST_CONFIG_HPP_INCLUDED

// Include build configuration
#include <moenster/config.h>

namespace mst {

// Collapse a run of consecutive '*' into one before backtracking.
// Results are the same either way; a run of n stars otherwise nests
// n levels of trials before the rest of the pattern is reached.
inline constexpr bool coalesce_stars = true;

// Makes the following pattern byte literal, inside and outside of [...].
inline constexpr unsigned char escape_char = '\\';

// As the first byte of a bracket class, inverts the class.
inline constexpr unsigned char class_negate_char = '^';

// Separates the endpoints of a range inside a bracket class.
inline constexpr unsigned char class_range_char = '-';

}  // namespace mst

#endif
