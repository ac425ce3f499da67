// Self-test harness: each test is a bool function, the runner prints
// PASS/FAIL per test and exits non-zero on any failure.

#ifndef DRAWFORM_TEST_HARNESS_H
#define DRAWFORM_TEST_HARNESS_H

#include <cstdio>
#include <sstream>
#include <string>

#define TEST_CHECK(cond)                                                        \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::printf("    check failed: %s (%s:%d)\n", #cond, __FILE__,      \
                        __LINE__);                                              \
            return false;                                                       \
        }                                                                       \
    } while (0)

#define TEST_CHECK_EQ(actual, expected)                                         \
    do {                                                                        \
        const auto& test_a_ = (actual);                                         \
        const auto& test_e_ = (expected);                                       \
        if (!(test_a_ == test_e_)) {                                            \
            std::ostringstream test_msg_;                                       \
            test_msg_ << "expected [" << test_e_ << "] got [" << test_a_ << "]"; \
            std::printf("    check failed: %s == %s, %s (%s:%d)\n", #actual,    \
                        #expected, test_msg_.str().c_str(), __FILE__, __LINE__);\
            return false;                                                       \
        }                                                                       \
    } while (0)

#endif // DRAWFORM_TEST_HARNESS_H
