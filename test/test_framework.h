#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit test harness for ctwallet: self-registering cases, non-fatal
// checks, and a runner that takes an optional suite-name filter.

#include <cmath>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace test {

struct TestCase {
    std::string suite;
    std::string name;
    std::function<void()> body;
};

struct Tally {
    int passed = 0;
    int failed = 0;
};

inline std::vector<TestCase>& registry() {
    static std::vector<TestCase> cases;
    return cases;
}

inline Tally& tally() {
    static Tally t;
    return t;
}

struct Registrar {
    Registrar(const char* suite, const char* name, std::function<void()> body) {
        registry().push_back({suite, name, std::move(body)});
    }
};

template <typename T, typename = void>
struct Printable : std::false_type {};
template <typename T>
struct Printable<T, std::void_t<decltype(std::declval<std::ostream&>()
                                         << std::declval<const T&>())>>
    : std::true_type {};

template <typename T>
std::string show(const T& v) {
    if constexpr (Printable<T>::value) {
        std::ostringstream os;
        os << v;
        return os.str();
    } else {
        return "<unprintable>";
    }
}

inline void record(bool ok, const char* file, int line, const std::string& what) {
    if (ok) {
        ++tally().passed;
        return;
    }
    ++tally().failed;
    std::cerr << "  FAIL " << file << ":" << line << ": " << what << std::endl;
}

template <typename A, typename B>
void check_eq(const A& a, const B& b, const char* a_expr, const char* b_expr,
              const char* file, int line) {
    const bool ok = a == b;
    record(ok, file, line,
           ok ? std::string()
              : std::string("CHECK_EQ(") + a_expr + ", " + b_expr + "): " +
                    show(a) + " vs " + show(b));
}

template <typename A, typename B>
void check_ne(const A& a, const B& b, const char* a_expr, const char* b_expr,
              const char* file, int line) {
    record(a != b, file, line,
           std::string("CHECK_NE(") + a_expr + ", " + b_expr + ")");
}

inline int run_all(std::string_view filter = {}) {
    tally() = Tally{};
    std::string suite;
    int run = 0;
    for (const auto& tc : registry()) {
        if (!filter.empty() && tc.suite != filter) continue;
        if (tc.suite != suite) {
            suite = tc.suite;
            std::cout << "\n[" << suite << "]" << std::endl;
        }
        std::cout << "  " << tc.name << " ... " << std::flush;
        const int failed_before = tally().failed;
        try {
            tc.body();
        } catch (const std::exception& e) {
            record(false, tc.suite.c_str(), 0,
                   tc.name + " threw: " + e.what());
        }
        std::cout << (tally().failed == failed_before ? "ok" : "FAILED")
                  << std::endl;
        ++run;
    }
    std::cout << "\n" << run << " tests, " << tally().passed << " checks passed, "
              << tally().failed << " failed" << std::endl;
    return tally().failed == 0 && run > 0 ? 0 : 1;
}

} // namespace test

#define TEST_CASE(suite, name)                                  \
    static void test_##suite##_##name();                        \
    static ::test::Registrar registrar_##suite##_##name(        \
        #suite, #name, &test_##suite##_##name);                 \
    static void test_##suite##_##name()

#define CHECK(expr) \
    ::test::record(static_cast<bool>(expr), __FILE__, __LINE__, "CHECK(" #expr ")")
#define CHECK_EQ(a, b) ::test::check_eq((a), (b), #a, #b, __FILE__, __LINE__)
#define CHECK_NE(a, b) ::test::check_ne((a), (b), #a, #b, __FILE__, __LINE__)
#define CHECK_NEAR(a, b, eps)                                                 \
    ::test::record(std::fabs((a) - (b)) <= (eps), __FILE__, __LINE__,         \
                   "CHECK_NEAR(" #a ", " #b ")")

#define CHECK_THROWS(expr)                                                    \
    do {                                                                      \
        bool threw_ = false;                                                  \
        try { (void)(expr); } catch (const std::exception&) { threw_ = true; } \
        ::test::record(threw_, __FILE__, __LINE__, "CHECK_THROWS(" #expr ")"); \
    } while (0)

#define CHECK_NOTHROW(expr)                                                   \
    do {                                                                      \
        std::string what_;                                                    \
        try { (void)(expr); } catch (const std::exception& e) { what_ = e.what(); } \
        ::test::record(what_.empty(), __FILE__, __LINE__,                     \
                       "CHECK_NOTHROW(" #expr ") threw " + what_);           \
    } while (0)

#define CHECK_OK(result_expr)                                                 \
    do {                                                                      \
        auto&& r_ = (result_expr);                                            \
        ::test::record(r_.ok(), __FILE__, __LINE__,                           \
                       r_.ok() ? std::string()                                \
                               : "CHECK_OK(" #result_expr "): " +             \
                                     r_.error().message());                   \
    } while (0)

#define CHECK_ERR(result_expr)                                                \
    do {                                                                      \
        auto&& r_ = (result_expr);                                            \
        ::test::record(!r_.ok(), __FILE__, __LINE__,                          \
                       "CHECK_ERR(" #result_expr ") succeeded");              \
    } while (0)

#define CHECK_ERR_CODE(result_expr, error_code)                               \
    do {                                                                      \
        auto&& r_ = (result_expr);                                            \
        ::test::record(!r_.ok() && r_.error().code() == (error_code),         \
                       __FILE__, __LINE__,                                    \
                       "CHECK_ERR_CODE(" #result_expr ", " #error_code ")");  \
    } while (0)
