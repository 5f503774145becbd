/* SPDX-License-Identifier: MPL-2.0 */
/* Moenster - Command line matching example */
/* Usage: match_example PATTERN SUBJECT [-i] */

#include <moenster/moenster.h>
#include <cstdio>
#include <cstring>

int main (int argc, char **argv)
{
    if (argc < 3 || argc > 4
        || (argc == 4 && strcmp (argv[3], "-i") != 0)) {
        fprintf (stderr, "usage: %s PATTERN SUBJECT [-i]\n", argv[0]);
        return 2;
    }

    int major, minor, patch;
    mst_version (&major, &minor, &patch);

    const int flags = argc == 4 ? MST_CASE_INSENSITIVE : 0;
    const int rc = mst_match_flags (argv[1], argv[2], flags);
    if (rc < 0) {
        fprintf (stderr, "moenster %d.%d.%d: %s\n", major, minor, patch,
                 mst_strerror (mst_errno ()));
        return 2;
    }

    printf ("%s\n", rc ? "match" : "no match");
    return rc ? 0 : 1;
}
