/* SPDX-License-Identifier: MPL-2.0 */
/* Moenster - Public C API Implementation */

#include "moenster/moenster.h"

#include <errno.h>
#include <string.h>

#include "pattern/glob_match.hpp"
#include "util/err.hpp"

// Thread-local storage for errno
#ifdef _WIN32
static __declspec(thread) int mst_errno_value = 0;
#else
static __thread int mst_errno_value = 0;
#endif

// Helper function to set errno and return error code
static inline int set_errno(int err)
{
    errno = EINVAL;
    mst_errno_value = err;
    return -1;
}

// Helper to validate pointers
#define CHECK_PTR(ptr, ret) \
    do { \
        if (!(ptr)) { \
            set_errno(MST_EINVAL); \
            return ret; \
        } \
    } while(0)

static const int known_flags = MST_CASE_INSENSITIVE;

// Flags to case mode; false if unknown bits are set
static bool flags_to_mode(int flags, mst::case_mode_t *mode)
{
    if ((flags & ~known_flags) != 0)
        return false;
    *mode = (flags & MST_CASE_INSENSITIVE) ? mst::case_mode_t::insensitive
                                           : mst::case_mode_t::sensitive;
    return true;
}

extern "C" {

/****************************************************************************/
/*  Version Information                                                     */
/****************************************************************************/

void MST_CALL mst_version(int *major, int *minor, int *patch)
{
    if (major) *major = MST_VERSION_MAJOR;
    if (minor) *minor = MST_VERSION_MINOR;
    if (patch) *patch = MST_VERSION_PATCH;
}

/****************************************************************************/
/*  Error Handling                                                          */
/****************************************************************************/

int MST_CALL mst_errno(void)
{
    return mst_errno_value;
}

const char* MST_CALL mst_strerror(int errnum)
{
    return mst::errno_to_string(errnum);
}

/****************************************************************************/
/*  Matching                                                                */
/****************************************************************************/

int MST_CALL mst_match(const char *pattern, const char *subject)
{
    return mst_match_flags(pattern, subject, 0);
}

int MST_CALL mst_match_flags(const char *pattern, const char *subject, int flags)
{
    CHECK_PTR(pattern, -1);
    CHECK_PTR(subject, -1);

    mst::case_mode_t mode;
    if (!flags_to_mode(flags, &mode))
        return set_errno(MST_EINVAL);

    return mst::glob_match(pattern, subject, mode) ? 1 : 0;
}

int MST_CALL mst_match_bytes(const void *pattern, size_t pattern_len,
                             const void *subject, size_t subject_len,
                             int flags)
{
    if ((!pattern && pattern_len > 0) || (!subject && subject_len > 0))
        return set_errno(MST_EINVAL);

    mst::case_mode_t mode;
    if (!flags_to_mode(flags, &mode))
        return set_errno(MST_EINVAL);

    return mst::glob_match(static_cast<const unsigned char *>(pattern),
                           pattern_len,
                           static_cast<const unsigned char *>(subject),
                           subject_len, mode)
             ? 1
             : 0;
}

} // extern "C"
