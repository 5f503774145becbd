/* SPDX-License-Identifier: MPL-2.0 */
/* Moenster - Error reporting and internal assertions */

#ifndef MST_ERR_HPP_INCLUDED
#define MST_ERR_HPP_INCLUDED

#include <cstdio>
#include <cstdlib>

#include "likely.hpp"

namespace mst {

// Message for a public MST_E* error code, "Unknown error" otherwise
const char *errno_to_string(int errno_);

#if defined __clang__
#if __has_feature(attribute_analyzer_noreturn)
void mst_abort(const char *errmsg_) __attribute__((analyzer_noreturn));
#else
void mst_abort(const char *errmsg_);
#endif
#elif defined _MSC_VER
__declspec(noreturn) void mst_abort(const char *errmsg_);
#else
void mst_abort(const char *errmsg_);
#endif

}  // namespace mst

// This macro works in exactly the same way as the normal assert.
#define mst_assert(x) \
    do { \
        if (unlikely(!(x))) { \
            fprintf(stderr, "Assertion failed: %s (%s:%d)\n", #x, __FILE__, \
                    __LINE__); \
            fflush(stderr); \
            mst::mst_abort(#x); \
        } \
    } while (false)

#endif
