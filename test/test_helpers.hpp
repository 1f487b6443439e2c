#pragma once

#include <string>
#include <sstream>
#include <stdexcept>
#include <functional>

namespace pearl {
namespace test {

// Enhanced assertion helper
class AssertHelper {
public:
    static void assert_true(bool condition, const std::string& message) {
        if (!condition) {
            throw std::runtime_error("Assertion failed: " + message);
        }
    }

    static void assert_false(bool condition, const std::string& message) {
        if (condition) {
            throw std::runtime_error("Assertion failed: " + message);
        }
    }

    static void assert_contains(const std::string& text, const std::string& substring,
                               const std::string& context = "") {
        if (text.find(substring) == std::string::npos) {
            std::ostringstream oss;
            oss << "Expected to find '" << substring << "' in text";
            if (!context.empty()) {
                oss << " (" << context << ")";
            }
            oss << "\nActual text: " << text;
            throw std::runtime_error(oss.str());
        }
    }

    static void assert_starts_with(const std::string& text, const std::string& prefix,
                                   const std::string& context = "") {
        if (text.compare(0, prefix.size(), prefix) != 0) {
            std::ostringstream oss;
            oss << "Expected text to start with '" << prefix << "'";
            if (!context.empty()) {
                oss << " (" << context << ")";
            }
            oss << "\nActual text: " << text;
            throw std::runtime_error(oss.str());
        }
    }

    static void assert_equals(const std::string& expected, const std::string& actual,
                             const std::string& context = "") {
        if (expected != actual) {
            std::ostringstream oss;
            oss << "Strings not equal";
            if (!context.empty()) {
                oss << " (" << context << ")";
            }
            oss << "\nExpected: " << expected;
            oss << "\nActual: " << actual;
            throw std::runtime_error(oss.str());
        }
    }

    template<typename T>
    static void assert_equals(const T& expected, const T& actual, const std::string& context = "") {
        if (expected != actual) {
            std::ostringstream oss;
            oss << "Values not equal";
            if (!context.empty()) {
                oss << " (" << context << ")";
            }
            oss << "\nExpected: " << expected;
            oss << "\nActual: " << actual;
            throw std::runtime_error(oss.str());
        }
    }

    template<typename T>
    static void assert_not_equals(const T& expected, const T& actual, const std::string& context = "") {
        if (expected == actual) {
            std::ostringstream oss;
            oss << "Values should not be equal";
            if (!context.empty()) {
                oss << " (" << context << ")";
            }
            oss << "\nUnexpected value: " << actual;
            throw std::runtime_error(oss.str());
        }
    }

    // Runs `fn` and expects it to throw E. Returns the message of the
    // caught exception.
    template<typename E>
    static std::string assert_throws(const std::function<void()>& fn, const std::string& context) {
        try {
            fn();
        } catch (const E& e) {
            return e.what();
        } catch (const std::exception& e) {
            throw std::runtime_error("Wrong exception type (" + context + "): " + e.what());
        }
        throw std::runtime_error("Expected exception was not thrown (" + context + ")");
    }
};

} // namespace test
} // namespace pearl
