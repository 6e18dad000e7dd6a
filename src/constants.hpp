#pragma once
#include <cstddef>

namespace af {

// ---- Numerical constants ----
// Mathematical constants
constexpr double PI = 3.141592653589793238462643383279502884;

// Distances at or below this are treated as coincident atoms
constexpr double EPS = 1e-12;

// Tolerance for symmetry / zero-diagonal checks on user distance matrices
constexpr double DIST_TOL = 1e-8;

// ---- Defaults ----
constexpr double DEFAULT_CUTOFF = 5.0;

}  // namespace af
