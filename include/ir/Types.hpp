// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Types.hpp
 * @brief Common type aliases and constants for the circuit exporter
 *
 * Provides foundational types used throughout the qexport library including
 * bit indices, operation identifiers, and numeric constants.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace qexport {

/// @brief Type alias for qubit and clbit indices within a register
using BitIndex = std::size_t;

/// @brief Type alias for unique operation identifiers
using OperationId = std::uint64_t;

/// @brief Type alias for real-valued gate parameters (angles in radians)
using Angle = double;

namespace constants {

/// @brief Absolute tolerance for floating-point comparisons
inline constexpr double TOLERANCE = 1e-10;

/// @brief Pi constant for rotation gates
inline constexpr double PI = 3.14159265358979323846;

/// @brief Largest denominator tried when folding a value into n*pi/d
inline constexpr int MAX_PI_DENOMINATOR = 16;

/// @brief Largest |n| rendered as n*pi/d; beyond it values stay decimal
inline constexpr double MAX_PI_NUMERATOR = 1e6;

}  // namespace constants

}  // namespace qexport
