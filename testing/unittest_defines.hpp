#ifndef _TESTING_UNITTEST_DEFINES_H_
#define _TESTING_UNITTEST_DEFINES_H_

// Each test file defines ENABLE_UNIT_TESTS before including this header.
// With ENABLE_UNIT_TESTS 0 its suites are renamed to FILTERED_<suite>, which
// gtest_main.cpp excludes from the default run.
#if ENABLE_UNIT_TESTS
#define T(x)            x
#define MY_TEST(x, y)   TEST(x, y)
#define MY_TEST_F(x, y) TEST_F(x, y)
#else
#define T(x)            FILTERED_##x
#define MY_TEST(x, y)   TEST(FILTERED_##x, y)
#define MY_TEST_F(x, y) TEST_F(FILTERED_##x, y)
#endif

#endif
