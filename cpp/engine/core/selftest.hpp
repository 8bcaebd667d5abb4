// ============================================================================
// Core: Selftest helpers (zero-dependency microtest support)
// File: cpp/engine/core/selftest.hpp
// ============================================================================
//
// Shared by every *_selftest.cpp executable:
//     calfuse::selftest::Report r;
//     test_something(r);
//     return calfuse::selftest::finish(r, "suite_name");
//
// A non-zero exit code means at least one failure. CTest picks that up.
//
// ============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace calfuse::selftest {

struct Report final {
    std::vector<std::string> failures;
    int checks = 0;

    bool ok() const noexcept { return failures.empty(); }

    void fail(const std::string& s) { failures.push_back(s); }

    void check(bool cond, const std::string& what) {
        ++checks;
        if (!cond) fail(what);
    }
};

// Approximate equality (relative with absolute floor).
inline bool near(double a, double b, double rel = 1e-9, double abs = 1e-12) noexcept {
    const double da = std::fabs(a - b);
    if (da <= abs) return true;
    const double sc = std::max({std::fabs(a), std::fabs(b), abs});
    return da / sc <= rel;
}

// True if fn() throws E (or a subclass). Any other exception is recorded as a failure.
template <class E, class Fn>
bool throws_as(Report& r, const std::string& label, Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    } catch (const std::exception& e) {
        r.fail(label + ": threw unexpected exception: " + e.what());
        return false;
    }
    return false;
}

inline int finish(const Report& r, const char* suite) {
    for (const auto& f : r.failures) std::cerr << "[FAIL] " << suite << ": " << f << "\n";
    if (r.ok()) {
        std::cerr << "[ OK ] " << suite << " (" << r.checks << " checks)\n";
        return 0;
    }
    std::cerr << "[FAIL] " << suite << ": " << r.failures.size() << " failure(s)\n";
    return 1;
}

}  // namespace calfuse::selftest
