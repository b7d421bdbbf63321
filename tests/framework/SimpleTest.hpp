#pragma once

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cadence::test {

class AssertionFailure : public std::runtime_error {
public:
    explicit AssertionFailure(const std::string& msg) : std::runtime_error(msg) {}
};

inline std::string where(const char* file, int line) {
    return std::string(file) + ":" + std::to_string(line);
}

class TestRunner {
public:
    static TestRunner& instance() {
        static TestRunner runner;
        return runner;
    }

    void register_test(std::string name, std::function<void()> body) {
        tests_.push_back({std::move(name), std::move(body)});
    }

    // CADENCE_TEST_FILTER=substring runs only the matching cases
    int run_all() {
        const char* env = std::getenv("CADENCE_TEST_FILTER");
        std::string_view filter = env ? env : "";

        std::vector<std::string> failures;
        int passed = 0;
        auto suite_start = std::chrono::steady_clock::now();

        for (const auto& test : tests_) {
            if (!filter.empty() && test.name.find(filter) == std::string::npos) continue;

            std::string error;
            try {
                test.body();
            } catch (const std::exception& e) {
                error = e.what();
            } catch (...) {
                error = "non-standard exception";
            }

            if (error.empty()) {
                std::cout << "[PASS] " << test.name << std::endl;
                ++passed;
            } else {
                std::cout << "[FAIL] " << test.name << " - " << error << std::endl;
                failures.push_back(test.name);
            }
        }

        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - suite_start).count();
        std::cout << "\n" << passed << " passed, " << failures.size() << " failed (" << ms << "ms)" << std::endl;
        for (const auto& name : failures) {
            std::cout << "  failed: " << name << std::endl;
        }
        return failures.empty() ? 0 : 1;
    }

private:
    struct Entry {
        std::string name;
        std::function<void()> body;
    };
    std::vector<Entry> tests_;
};

struct Registrar {
    Registrar(const char* name, void (*body)()) {
        TestRunner::instance().register_test(name, body);
    }
};

}  // namespace cadence::test

#define TEST_CASE(name) \
    static void name(); \
    static cadence::test::Registrar registrar_##name(#name, name); \
    static void name()

#define CADENCE_FAIL(text) \
    throw cadence::test::AssertionFailure(std::string(text) + " at " + cadence::test::where(__FILE__, __LINE__))

#define ASSERT_TRUE(condition) \
    do { if (!(condition)) CADENCE_FAIL("expected true: " #condition); } while (0)

#define ASSERT_FALSE(condition) \
    do { if (condition) CADENCE_FAIL("expected false: " #condition); } while (0)

#define ASSERT_EQ(a, b) \
    do { if (!((a) == (b))) CADENCE_FAIL("expected " #a " == " #b); } while (0)

#define ASSERT_NEAR(a, b, epsilon) \
    do { if (std::abs((a) - (b)) > (epsilon)) CADENCE_FAIL("expected " #a " within " #epsilon " of " #b); } while (0)
