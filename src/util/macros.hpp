/* SPDX-License-Identifier: MPL-2.0 */
/* Moenster - Internal helper macros */

#ifndef MST_MACROS_HPP_INCLUDED
#define MST_MACROS_HPP_INCLUDED

#include <moenster/config.h>

#define MST_UNUSED(object) (void) object

// Debug logging - only enabled when explicitly requested
#ifdef MST_ENABLE_DEBUG_LOG
    #include <cstdio>
    #define MST_DEBUG_LOG(...) fprintf(stderr, __VA_ARGS__)
#else
    #define MST_DEBUG_LOG(...)
#endif

#endif
