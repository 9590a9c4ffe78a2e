#pragma once
#include <functional>
#include <markov/math/vec.hpp>

namespace markov::math {

using PotentialFn = std::function<double(const Vector &)>;
using GradientFn = std::function<Vector(const Vector &)>;

// Central finite-difference gradient of U with step h per coordinate.
// Costs 2 * dim evaluations of U per call.
GradientFn central_difference(PotentialFn U, double h = 1e-5);

} // namespace markov::math
