/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file framework.hpp
 * @brief Header-only unit testing micro-framework for the Phone Address Service.
 *
 * @details
 * ANSI-colored terminal output, exception-protected test bodies and a small
 * set of assertion macros. A failed assertion throws, which aborts the current
 * test only; the runner moves on to the next one.
 */

#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace phoneaddr::test {

// ========================================================================
// Global Metrics
// ========================================================================

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.

/// @brief Thrown by assertion primitives after the failure has been reported.
class AssertionFailure : public std::runtime_error {
  public:
    AssertionFailure() : std::runtime_error("Assertion failed") {}
};

// ========================================================================
// Assertion Primitives
// ========================================================================

template <typename T> void assert_eq(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 != val2) {
        std::cout << "\n\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " != " << val2 << ")"
                  << std::endl;
        throw AssertionFailure();
    }
}

template <typename T> void assert_ne(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        std::cout << "\n\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " == " << val2 << ")"
                  << std::endl;
        throw AssertionFailure();
    }
}

inline void assert_true(bool cond, const char* file, int line, const char* expr)
{
    if (!cond) {
        std::cout << "\n\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is FALSE" << std::endl;
        throw AssertionFailure();
    }
}

inline void assert_false(bool cond, const char* file, int line, const char* expr)
{
    if (cond) {
        std::cout << "\n\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is TRUE" << std::endl;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that @p func throws an exception of type `E`.
 */
template <typename E, typename F>
void assert_throws(F&& func, const char* file, int line, const char* expr)
{
    try {
        func();
    } catch (const E&) {
        return;
    } catch (const std::exception& e) {
        std::cout << "\n\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
                  << " threw an unexpected exception: " << e.what() << std::endl;
        throw AssertionFailure();
    }
    std::cout << "\n\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
              << " did not throw" << std::endl;
    throw AssertionFailure();
}

// ========================================================================
// Execution Orchestrator
// ========================================================================

/**
 * @brief Executes a test case within a protected execution context.
 */
inline void run(std::string_view name, std::function<void()> func)
{
    std::cout << "[RUN  ] " << name << "... " << std::flush;
    try {
        func();
        std::cout << "\r\033[32m[PASS]\033[0m " << name << "          " << std::endl;
        passed_count++;
    } catch (const AssertionFailure&) {
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
        failed_count++;
    } catch (const std::exception& e) {
        std::cout << "\n\033[31m[FAIL]\033[0m " << name << " -> uncaught exception: " << e.what()
                  << std::endl;
        failed_count++;
    }
}

inline void print_summary()
{
    std::cout << "\n\033[36m=== Phone Address Service Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count) << std::endl;
}

} // namespace phoneaddr::test

// ============================================================================
// API Macros
// ============================================================================

#define ASSERT_EQ(a, b) phoneaddr::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)

#define ASSERT_NE(a, b) phoneaddr::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)

#define ASSERT_TRUE(a) phoneaddr::test::assert_true((a), __FILE__, __LINE__, #a)

#define ASSERT_FALSE(a) phoneaddr::test::assert_false((a), __FILE__, __LINE__, #a)

/// @brief `ASSERT_THROWS(ExceptionType, statement)`.
#define ASSERT_THROWS(E, stmt)                                                                     \
    phoneaddr::test::assert_throws<E>([&]() { stmt; }, __FILE__, __LINE__, #stmt)

#define RUN_TEST(func_name) phoneaddr::test::run(#func_name, func_name)
