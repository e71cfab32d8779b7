#pragma once

// remedy/verifier.hpp: Numeric answer extraction and comparison.

#include <optional>
#include <string>

#include "remedy/types.hpp"

namespace remedy {

constexpr double kDefaultTolerance = 0.1;
// Absorbs binary representation error at the tolerance boundary.
constexpr double kToleranceSlack = 1e-9;

// First labeled value found in `stdout_text`, trying the labels in a fixed
// order (objective, cost, min cost, max profit, total profit, solution,
// value, answer). Case-insensitive.
std::optional<double> extract_answer(const std::string& stdout_text);

// Trimmed, fully consumed, finite. Anything else (empty, sentinel text,
// NaN, Inf) is nullopt.
std::optional<double> parse_expected(const std::string& expected);

VerificationOutcome verify(const std::string& stdout_text, const std::string& expected,
                           double tolerance = kDefaultTolerance);

}  // namespace remedy
