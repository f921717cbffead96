// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Gate.hpp
 * @brief Standard gate vocabulary and gate metadata
 *
 * Enumerates the gates declared by OpenQASM 3's stdgates.inc together with
 * the built-in universal gate U. Circuits built only from these gates export
 * without any definition blocks.
 *
 * @see Operation.hpp for operations and instructions
 * @see Types.hpp for common type definitions
 */

#pragma once

#include "Types.hpp"

#include <array>
#include <string_view>

namespace qexport::ir {

/**
 * @brief Enumeration of standard gates.
 *
 * U is the language built-in; everything else comes from stdgates.inc.
 */
enum class StandardGate {
    // Language built-in
    U,      ///< Universal single-qubit gate U(theta, phi, lambda)

    // Single-qubit gates
    P,      ///< Phase gate
    X,      ///< Pauli-X (NOT) gate
    Y,      ///< Pauli-Y gate
    Z,      ///< Pauli-Z gate
    H,      ///< Hadamard gate
    S,      ///< S gate (sqrt(Z))
    Sdg,    ///< S-dagger gate
    T,      ///< T gate (sqrt(S))
    Tdg,    ///< T-dagger gate
    SX,     ///< sqrt(X) gate
    RX,     ///< Rotation around X-axis
    RY,     ///< Rotation around Y-axis
    RZ,     ///< Rotation around Z-axis
    Id,     ///< Identity
    U1,     ///< Legacy single-parameter U
    U2,     ///< Legacy two-parameter U
    U3,     ///< Legacy three-parameter U

    // Two-qubit gates
    CX,     ///< Controlled-NOT
    CY,     ///< Controlled-Y
    CZ,     ///< Controlled-Z
    CP,     ///< Controlled phase
    CRX,    ///< Controlled Rx
    CRY,    ///< Controlled Ry
    CRZ,    ///< Controlled Rz
    CH,     ///< Controlled Hadamard
    Swap,   ///< SWAP
    CU,     ///< Controlled U with global phase

    // Three-qubit gates
    CCX,    ///< Toffoli
    CSwap   ///< Fredkin
};

/// @brief Every standard gate, in declaration order.
inline constexpr std::array<StandardGate, 30> ALL_STANDARD_GATES = {
    StandardGate::U,   StandardGate::P,   StandardGate::X,    StandardGate::Y,
    StandardGate::Z,   StandardGate::H,   StandardGate::S,    StandardGate::Sdg,
    StandardGate::T,   StandardGate::Tdg, StandardGate::SX,   StandardGate::RX,
    StandardGate::RY,  StandardGate::RZ,  StandardGate::Id,   StandardGate::U1,
    StandardGate::U2,  StandardGate::U3,  StandardGate::CX,   StandardGate::CY,
    StandardGate::CZ,  StandardGate::CP,  StandardGate::CRX,  StandardGate::CRY,
    StandardGate::CRZ, StandardGate::CH,  StandardGate::Swap, StandardGate::CU,
    StandardGate::CCX, StandardGate::CSwap,
};

/**
 * @brief Returns the OpenQASM name of a standard gate.
 * @param gate The gate
 * @return Name as written in source, e.g. "h", "cx", "U"
 */
[[nodiscard]] constexpr std::string_view gateName(StandardGate gate) noexcept {
    switch (gate) {
        case StandardGate::U:     return "U";
        case StandardGate::P:     return "p";
        case StandardGate::X:     return "x";
        case StandardGate::Y:     return "y";
        case StandardGate::Z:     return "z";
        case StandardGate::H:     return "h";
        case StandardGate::S:     return "s";
        case StandardGate::Sdg:   return "sdg";
        case StandardGate::T:     return "t";
        case StandardGate::Tdg:   return "tdg";
        case StandardGate::SX:    return "sx";
        case StandardGate::RX:    return "rx";
        case StandardGate::RY:    return "ry";
        case StandardGate::RZ:    return "rz";
        case StandardGate::Id:    return "id";
        case StandardGate::U1:    return "u1";
        case StandardGate::U2:    return "u2";
        case StandardGate::U3:    return "u3";
        case StandardGate::CX:    return "cx";
        case StandardGate::CY:    return "cy";
        case StandardGate::CZ:    return "cz";
        case StandardGate::CP:    return "cp";
        case StandardGate::CRX:   return "crx";
        case StandardGate::CRY:   return "cry";
        case StandardGate::CRZ:   return "crz";
        case StandardGate::CH:    return "ch";
        case StandardGate::Swap:  return "swap";
        case StandardGate::CU:    return "cu";
        case StandardGate::CCX:   return "ccx";
        case StandardGate::CSwap: return "cswap";
    }
    return "unknown";
}

/**
 * @brief Returns the number of qubits a standard gate acts on.
 */
[[nodiscard]] constexpr std::size_t numQubitsFor(StandardGate gate) noexcept {
    switch (gate) {
        case StandardGate::CX:
        case StandardGate::CY:
        case StandardGate::CZ:
        case StandardGate::CP:
        case StandardGate::CRX:
        case StandardGate::CRY:
        case StandardGate::CRZ:
        case StandardGate::CH:
        case StandardGate::Swap:
        case StandardGate::CU:
            return 2;
        case StandardGate::CCX:
        case StandardGate::CSwap:
            return 3;
        default:
            return 1;
    }
}

/**
 * @brief Returns the number of real parameters a standard gate takes.
 */
[[nodiscard]] constexpr std::size_t numParamsFor(StandardGate gate) noexcept {
    switch (gate) {
        case StandardGate::P:
        case StandardGate::RX:
        case StandardGate::RY:
        case StandardGate::RZ:
        case StandardGate::U1:
        case StandardGate::CP:
        case StandardGate::CRX:
        case StandardGate::CRY:
        case StandardGate::CRZ:
            return 1;
        case StandardGate::U2:
            return 2;
        case StandardGate::U:
        case StandardGate::U3:
            return 3;
        case StandardGate::CU:
            return 4;
        default:
            return 0;
    }
}

/**
 * @brief Returns whether a gate is a language built-in (needs no include).
 */
[[nodiscard]] constexpr bool isLanguageBuiltin(StandardGate gate) noexcept {
    return gate == StandardGate::U;
}

}  // namespace qexport::ir
