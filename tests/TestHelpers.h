#pragma once
#include <cmath>
#include <stdexcept>
#include <string>

inline void assertEqual(double v1, double v2, double atol, double rtol) {
    double diff = std::fabs(v1 - v2);
    if (diff > atol && diff / std::fabs(v1) > rtol)
        throw std::runtime_error(std::string("Assertion failure: expected ") + std::to_string(v1) +
                                 " found " + std::to_string(v2));
}

inline void assertExact(double v1, double v2) {
    if (!(v1 == v2))
        throw std::runtime_error(std::string("Assertion failure: expected exactly ") +
                                 std::to_string(v1) + " found " + std::to_string(v2));
}

inline void assertTrue(bool condition, const std::string &message) {
    if (!condition)
        throw std::runtime_error("Assertion failure: " + message);
}

// Fails unless fn() throws E
template <typename E, typename Fn>
void assertThrows(Fn &&fn, const std::string &message) {
    try {
        fn();
    } catch (const E &) {
        return;
    }
    throw std::runtime_error("Assertion failure: expected exception: " + message);
}

// Half-cosine cutoff written out independently of the library
inline double referenceCutoff(double r, double rc) {
    return r < rc ? 0.5 * (std::cos(3.141592653589793 * r / rc) + 1.0) : 0.0;
}
