/* SPDX-License-Identifier: MPL-2.0 */
/* Moenster - Error reporting and internal assertions */

#include "err.hpp"
#include "macros.hpp"

#include <moenster/moenster.h>

#ifdef _WIN32
#include <windows.h>
#endif

const char *mst::errno_to_string(int errno_)
{
    switch (errno_) {
        case MST_EINVAL:
            return "Invalid argument";
        default:
            return "Unknown error";
    }
}

void mst::mst_abort(const char *errmsg_)
{
#ifdef _WIN32
    // Raise STATUS_FATAL_APP_EXIT.
    ULONG_PTR extra_info[1];
    extra_info[0] = (ULONG_PTR) errmsg_;
    RaiseException(0x40000015, EXCEPTION_NONCONTINUABLE, 1, extra_info);
#else
    MST_UNUSED(errmsg_);
    abort();
#endif
}
