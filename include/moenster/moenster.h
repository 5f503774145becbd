/* Moenster - Glob-style string matching library */
/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef MOENSTER_H
#define MOENSTER_H

#include "moenster_export.h"
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/****************************************************************************/
/*  Version Information                                                     */
/****************************************************************************/

#define MST_VERSION_MAJOR 0
#define MST_VERSION_MINOR 1
#define MST_VERSION_PATCH 0

MST_EXPORT void MST_CALL mst_version(int *major, int *minor, int *patch);

/****************************************************************************/
/*  Match Flags                                                             */
/****************************************************************************/

#define MST_CASE_INSENSITIVE 1  /* Fold ASCII letters before comparing */

/****************************************************************************/
/*  Error Codes                                                             */
/****************************************************************************/

#define MST_EINVAL      1   /* Invalid argument */

MST_EXPORT int MST_CALL mst_errno(void);
MST_EXPORT const char* MST_CALL mst_strerror(int errnum);

/****************************************************************************/
/*  Matching                                                                */
/****************************************************************************/

/*
 * The whole subject must match the whole pattern. Supported wildcards:
 *
 *   *        any run of bytes, including none
 *   ?        exactly one byte
 *   [abc]    one byte out of the set
 *   [a-z]    one byte out of the (inclusive) range, reversed ends are swapped
 *   [^...]   one byte not in the set
 *   \x       the byte x taken literally
 *
 * Matching is byte-per-byte; a multi-byte UTF-8 character needs one '?'
 * per byte. A malformed pattern never fails: an unterminated class is
 * evaluated with the members seen, an empty class never matches and a
 * trailing backslash is a literal backslash.
 *
 * Return value: 1 on match, 0 on mismatch, -1 on error (see mst_errno).
 */
MST_EXPORT int MST_CALL mst_match(const char *pattern, const char *subject);
MST_EXPORT int MST_CALL mst_match_flags(const char *pattern, const char *subject, int flags);

/* Buffers may contain NUL bytes. A NULL buffer is only valid with length 0. */
MST_EXPORT int MST_CALL mst_match_bytes(const void *pattern, size_t pattern_len,
                                        const void *subject, size_t subject_len,
                                        int flags);

#ifdef __cplusplus
}
#endif

#endif /* MOENSTER_H */
