// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file NumberFormat.hpp
 * @brief Pi-aware rendering of real gate parameters
 *
 * Values that are rational multiples of pi with a small denominator render
 * symbolically ("pi/2", "-5*pi", "3*pi/4"); everything else renders as the
 * shortest decimal literal that reads back to the same double.
 */

#pragma once

#include "ir/Types.hpp"

#include <fmt/format.h>

#include <cmath>
#include <optional>
#include <string>

namespace qexport::qasm3 {

/**
 * @brief Formats a real as a decimal literal.
 *
 * Uses the shortest round-trip representation and always yields a float
 * literal, so 2.0 renders as "2.0" rather than "2".
 */
[[nodiscard]] inline std::string formatReal(double value) {
    std::string text = fmt::format("{}", value);
    if (std::isfinite(value) &&
        text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

/**
 * @brief Renders value as n*pi/d if it is one.
 * @param value The value to test
 * @return Symbolic text, or std::nullopt if value is zero, non-finite, or no
 *         n/d with d <= MAX_PI_DENOMINATOR and |n| <= MAX_PI_NUMERATOR
 *         matches
 *
 * The match is on value * d / pi lying within TOLERANCE of an integer, so
 * large values that merely approximate a multiple of pi stay decimal.
 */
[[nodiscard]] inline std::optional<std::string> formatPiMultiple(double value) {
    if (!std::isfinite(value) || value == 0.0) {
        return std::nullopt;
    }

    for (int d = 1; d <= constants::MAX_PI_DENOMINATOR; ++d) {
        const double ratio = value * d / constants::PI;
        const double n_real = std::round(ratio);
        if (n_real == 0.0 || std::abs(n_real) > constants::MAX_PI_NUMERATOR ||
            std::abs(ratio - n_real) > constants::TOLERANCE) {
            continue;
        }

        const auto n = static_cast<long long>(n_real);
        if (d == 1) {
            if (n == 1) return std::string("pi");
            if (n == -1) return std::string("-pi");
            return fmt::format("{}*pi", n);
        }
        if (n == 1) return fmt::format("pi/{}", d);
        if (n == -1) return fmt::format("-pi/{}", d);
        return fmt::format("{}*pi/{}", n, d);
    }
    return std::nullopt;
}

/**
 * @brief Formats a gate parameter.
 * @param value The value
 * @param fold_constants If false, never render symbolically
 */
[[nodiscard]] inline std::string formatParameter(double value, bool fold_constants) {
    if (fold_constants) {
        if (auto symbolic = formatPiMultiple(value)) {
            return *symbolic;
        }
    }
    return formatReal(value);
}

}  // namespace qexport::qasm3
