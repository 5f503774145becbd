/* Moenster C API Tests */
/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "../testutil.hpp"

/* Test 1: Version information */
static void test_version()
{
    int major = -1, minor = -1, patch = -1;
    mst_version(&major, &minor, &patch);
    TEST_ASSERT_EQ(major, MST_VERSION_MAJOR);
    TEST_ASSERT_EQ(minor, MST_VERSION_MINOR);
    TEST_ASSERT_EQ(patch, MST_VERSION_PATCH);

    /* NULL out-pointers are skipped */
    mst_version(NULL, NULL, NULL);
}

/* Test 2: Matching NUL-terminated strings */
static void test_match_strings()
{
    TEST_ASSERT_EQ(mst_match("m*nster", "m\xc3\xb8nster"), 1);
    TEST_ASSERT_EQ(mst_match("mo?nst?r", "moenster"), 1);
    TEST_ASSERT_EQ(mst_match("m[oei]enster", "moenster"), 1);
    TEST_ASSERT_EQ(mst_match("m[bcd]enster", "moenster"), 0);
    TEST_ASSERT_EQ(mst_match("m[^a-c]enster", "moenster"), 1);
    TEST_ASSERT_EQ(mst_match("m[^n-p]enster", "moenster"), 0);
    TEST_ASSERT_EQ(mst_match("m[\\].;]o", "m]o"), 1);
    TEST_ASSERT_EQ(mst_match("moenster?", "moenster"), 0);
    TEST_ASSERT_EQ(mst_match("", ""), 1);
    TEST_ASSERT_EQ(mst_match("*", ""), 1);
}

/* Test 3: Case flags */
static void test_match_flags()
{
    TEST_ASSERT(!test_match("ABC", "abc"));
    TEST_ASSERT(test_match("ABC", "abc", MST_CASE_INSENSITIVE));
    TEST_ASSERT(test_match("[a-c]x", "BX", MST_CASE_INSENSITIVE));

    /* mst_match is the case-sensitive form */
    TEST_ASSERT_EQ(mst_match("ABC", "abc"), mst_match_flags("ABC", "abc", 0));
}

/* Test 4: Byte buffers with embedded NUL */
static void test_match_bytes()
{
    const char pattern[] = {'a', '?', 'c'};
    const char subject[] = {'a', '\0', 'c'};

    TEST_ASSERT_EQ(mst_match_bytes(pattern, sizeof(pattern), subject, sizeof(subject), 0), 1);
    TEST_ASSERT_EQ(mst_match_bytes(pattern, 2, subject, sizeof(subject), 0), 0);
    TEST_ASSERT_EQ(mst_match_bytes(NULL, 0, NULL, 0, 0), 1);
    TEST_ASSERT_EQ(mst_match_bytes("*", 1, NULL, 0, 0), 1);
    TEST_ASSERT_EQ(mst_match_bytes("A", 1, "a", 1, MST_CASE_INSENSITIVE), 1);
}

/* Test 5: Invalid arguments report MST_EINVAL */
static void test_invalid_arguments()
{
    TEST_ASSERT_EQ(mst_match(NULL, "a"), -1);
    TEST_ASSERT_EQ(mst_errno(), MST_EINVAL);

    TEST_ASSERT_EQ(mst_match("a", NULL), -1);
    TEST_ASSERT_EQ(mst_errno(), MST_EINVAL);

    TEST_ASSERT_EQ(mst_match_flags("a", "a", 0x100), -1);
    TEST_ASSERT_EQ(mst_errno(), MST_EINVAL);

    TEST_ASSERT_EQ(mst_match_bytes(NULL, 3, "a", 1, 0), -1);
    TEST_ASSERT_EQ(mst_match_bytes("a", 1, NULL, 1, 0), -1);
    TEST_ASSERT_EQ(mst_errno(), MST_EINVAL);
}

/* Test 6: Error strings */
static void test_strerror()
{
    TEST_ASSERT_STR_EQ(mst_strerror(MST_EINVAL), "Invalid argument");
    TEST_ASSERT_STR_EQ(mst_strerror(12345), "Unknown error");
}

int main()
{
    printf("Running C API tests...\n");

    RUN_TEST(test_version);
    RUN_TEST(test_match_strings);
    RUN_TEST(test_match_flags);
    RUN_TEST(test_match_bytes);
    RUN_TEST(test_invalid_arguments);
    RUN_TEST(test_strerror);

    printf("All C API tests passed!\n");
    return 0;
}
