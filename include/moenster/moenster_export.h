/* Moenster DLL Export/Import Macros */
/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef MOENSTER_EXPORT_H
#define MOENSTER_EXPORT_H

/* Symbol visibility and DLL export/import macros */
#if defined(_WIN32) || defined(__CYGWIN__)
    #ifdef MST_BUILDING_DLL
        #ifdef __GNUC__
            #define MST_EXPORT __attribute__((dllexport))
        #else
            #define MST_EXPORT __declspec(dllexport)
        #endif
    #elif defined(MST_USING_DLL)
        #ifdef __GNUC__
            #define MST_EXPORT __attribute__((dllimport))
        #else
            #define MST_EXPORT __declspec(dllimport)
        #endif
    #else
        /* Static library */
        #define MST_EXPORT
    #endif
#else
    #if defined(__GNUC__) && __GNUC__ >= 4
        #define MST_EXPORT __attribute__((visibility("default")))
    #else
        #define MST_EXPORT
    #endif
#endif

/* Calling convention (Windows-specific) */
#if defined(_WIN32) && !defined(__GNUC__)
    #define MST_CALL __cdecl
#else
    #define MST_CALL
#endif

#endif /* MOENSTER_EXPORT_H */
