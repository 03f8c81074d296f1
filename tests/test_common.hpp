/**
 * @file test_common.hpp
 * @brief Minimal assertion and runner macros shared by the unit tests
 *
 * A test is a void function; a failed assertion throws and RUN_TEST
 * reports it.
 */

#ifndef TETHER_TEST_COMMON_HPP
#define TETHER_TEST_COMMON_HPP

#include <cstdio>
#include <stdexcept>
#include <string>

static int tests_passed = 0;
static int tests_failed = 0;

[[noreturn]] inline void test_fail(const char *what, int line) {
    throw std::runtime_error(std::string("Assertion failed: ") + what + " (line " +
                             std::to_string(line) + ")");
}

#define TEST(name) void test_##name()

#define RUN_TEST(name)                                                                             \
    do {                                                                                           \
        printf("  %-48s", #name);                                                                  \
        fflush(stdout);                                                                            \
        try {                                                                                      \
            test_##name();                                                                         \
            printf(" OK\n");                                                                       \
            tests_passed++;                                                                        \
        } catch (const std::exception &e) {                                                        \
            printf(" FAIL: %s\n", e.what());                                                       \
            tests_failed++;                                                                        \
        } catch (...) {                                                                            \
            printf(" FAIL: non-standard exception\n");                                             \
            tests_failed++;                                                                        \
        }                                                                                          \
    } while (0)

#define ASSERT(cond)                                                                               \
    do {                                                                                           \
        if (!(cond)) test_fail(#cond, __LINE__);                                                   \
    } while (0)

#define ASSERT_EQ(a, b) ASSERT((a) == (b))
#define ASSERT_NE(a, b) ASSERT(!((a) == (b)))
#define ASSERT_GT(a, b) ASSERT((a) > (b))
#define ASSERT_GE(a, b) ASSERT((a) >= (b))

#define ASSERT_THROWS(expr, exc_type)                                                              \
    do {                                                                                           \
        bool caught_ = false;                                                                      \
        try {                                                                                      \
            expr;                                                                                  \
        } catch (const exc_type &) {                                                               \
            caught_ = true;                                                                        \
        } catch (const std::exception &) {                                                         \
        }                                                                                          \
        if (!caught_) test_fail(#expr " throws " #exc_type, __LINE__);                             \
    } while (0)

#define TEST_SUMMARY()                                                                             \
    do {                                                                                           \
        printf("\n%d passed", tests_passed);                                                       \
        if (tests_failed > 0) printf(", %d FAILED", tests_failed);                                 \
        printf("\n");                                                                              \
    } while (0)

#endif // TETHER_TEST_COMMON_HPP
