/**
 * Tail Glow Battle Engine - Test Runner
 *
 * Assert-based test runner for the analysis engine. Every test file is
 * included below and registers itself through TEST(suite, name).
 *
 *   ./tailglow_tests                 all tests, per-suite summary
 *   ./tailglow_tests MatchupCache    tests whose "Suite::Name" contains the text
 *   ./tailglow_tests --list          registered test names
 */

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>

// Test result tracking
struct TestResult {
    std::string name;
    bool passed;
    std::string message;
    double duration_ms;
};

static std::vector<TestResult> g_results;
static int g_tests_run = 0;
static int g_tests_passed = 0;
static int g_tests_failed = 0;

// ============================================================================
// TEST MACROS
// ============================================================================

#define TEST_ASSERT(condition) \
    do { \
        if (!(condition)) { \
            throw std::runtime_error("Assertion failed: " #condition); \
        } \
    } while (0)

#define TEST_ASSERT_MSG(condition, msg) \
    do { \
        if (!(condition)) { \
            throw std::runtime_error(std::string("Assertion failed: ") + msg); \
        } \
    } while (0)

#define TEST_ASSERT_EQ(expected, actual) \
    do { \
        if ((expected) != (actual)) { \
            std::ostringstream oss; \
            oss << "Expected " << (expected) << " but got " << (actual); \
            throw std::runtime_error(oss.str()); \
        } \
    } while (0)

#define TEST_ASSERT_NE(val1, val2) \
    do { \
        if ((val1) == (val2)) { \
            throw std::runtime_error("Expected values to be different"); \
        } \
    } while (0)

#define TEST_ASSERT_NEAR(expected, actual, tolerance) \
    do { \
        if (std::abs((expected) - (actual)) > (tolerance)) { \
            std::ostringstream oss; \
            oss << "Expected " << (expected) << " +/- " << (tolerance) << " but got " << (actual); \
            throw std::runtime_error(oss.str()); \
        } \
    } while (0)

#define TEST_ASSERT_TRUE(condition) TEST_ASSERT(condition)
#define TEST_ASSERT_FALSE(condition) TEST_ASSERT(!(condition))
#define TEST_ASSERT_NULL(ptr) TEST_ASSERT((ptr) == nullptr)
#define TEST_ASSERT_NOT_NULL(ptr) TEST_ASSERT((ptr) != nullptr)

// ============================================================================
// TEST REGISTRATION
// ============================================================================

using TestFunc = std::function<void()>;

struct TestCase {
    std::string name;
    std::string suite;
    TestFunc func;
};

static std::vector<TestCase> g_tests;

class TestRegistrar {
public:
    TestRegistrar(const std::string& suite, const std::string& name, TestFunc func) {
        g_tests.push_back({name, suite, func});
    }
};

#define TEST(suite, name) \
    void test_##suite##_##name(); \
    static TestRegistrar g_registrar_##suite##_##name(#suite, #name, test_##suite##_##name); \
    void test_##suite##_##name()

// ============================================================================
// TEST RUNNER
// ============================================================================

// Per-suite tallies, in registration order
struct SuiteTally {
    std::string suite;
    int passed = 0;
    int failed = 0;
    double duration_ms = 0.0;
};

static std::vector<SuiteTally> g_suites;

SuiteTally& tally_for(const std::string& suite) {
    for (auto& tally : g_suites) {
        if (tally.suite == suite) return tally;
    }
    g_suites.push_back({suite});
    return g_suites.back();
}

bool matches(const TestCase& test, const std::string& pattern) {
    if (pattern.empty()) return true;
    std::string full_name = test.suite + "::" + test.name;
    return full_name.find(pattern) != std::string::npos;
}

void run_test(const TestCase& test) {
    g_tests_run++;

    TestResult result;
    result.name = test.suite + "::" + test.name;
    result.passed = false;

    // Analyzer and cache tests start threads; time the whole body
    auto start = std::chrono::steady_clock::now();
    try {
        test.func();
        result.passed = true;
        result.message = "OK";
    } catch (const std::exception& e) {
        result.message = e.what();
    } catch (...) {
        result.message = "Non-standard exception";
    }
    auto end = std::chrono::steady_clock::now();
    result.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();

    SuiteTally& tally = tally_for(test.suite);
    tally.duration_ms += result.duration_ms;
    if (result.passed) {
        g_tests_passed++;
        tally.passed++;
        std::cout << "  [PASS] " << result.name << "\n";
    } else {
        g_tests_failed++;
        tally.failed++;
        std::cout << "  [FAIL] " << result.name << "\n";
        std::cout << "         " << result.message << "\n";
    }
    g_results.push_back(result);
}

void print_summary() {
    std::cout << "\n=== Summary ===\n";
    for (const auto& tally : g_suites) {
        std::cout << "  " << tally.suite << ": " << tally.passed << "/" << (tally.passed + tally.failed)
                  << " (" << static_cast<int>(tally.duration_ms) << " ms)\n";
    }
    std::cout << "Total:  " << g_tests_run << "\n";
    std::cout << "Passed: " << g_tests_passed << "\n";
    std::cout << "Failed: " << g_tests_failed << "\n";

    const TestResult* slowest = nullptr;
    for (const auto& result : g_results) {
        if (!slowest || result.duration_ms > slowest->duration_ms) slowest = &result;
    }
    if (slowest) {
        std::cout << "Slowest: " << slowest->name << " (" << slowest->duration_ms << " ms)\n";
    }

    if (g_tests_failed > 0) {
        std::cout << "\nFailed tests:\n";
        for (const auto& result : g_results) {
            if (!result.passed) {
                std::cout << "  - " << result.name << ": " << result.message << "\n";
            }
        }
    }
    std::cout << "\n";
}

void run_tests(const std::string& pattern) {
    if (pattern.empty()) {
        std::cout << "\n=== Tail Glow Battle Engine Tests ===\n\n";
    } else {
        std::cout << "\n=== Running tests matching '" << pattern << "' ===\n\n";
    }

    std::string current_suite;
    for (const auto& test : g_tests) {
        if (!matches(test, pattern)) continue;
        if (test.suite != current_suite) {
            current_suite = test.suite;
            std::cout << "[" << current_suite << "]\n";
        }
        run_test(test);
    }
    print_summary();
}

void list_tests() {
    for (const auto& test : g_tests) {
        std::cout << test.suite << "::" << test.name << "\n";
    }
}

// ============================================================================
// MAIN
// ============================================================================

// Registration happens in static initializers, in include order
#include "test_damage.cpp"
#include "test_speed.cpp"
#include "test_simulator.cpp"
#include "test_cache.cpp"
#include "test_rankers.cpp"
#include "test_databases.cpp"
#include "test_analyzer.cpp"

int main(int argc, char* argv[]) {
    std::string pattern;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--list") {
            list_tests();
            return 0;
        }
        pattern = arg;
    }

    run_tests(pattern);
    if (g_tests_run == 0) {
        std::cerr << "No tests match '" << pattern << "'" << std::endl;
        return 1;
    }
    return g_tests_failed > 0 ? 1 : 0;
}
