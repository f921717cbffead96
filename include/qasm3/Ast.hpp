// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Ast.hpp
 * @brief Abstract syntax tree for emitted OpenQASM 3 programs
 * @author Rylan Malarchick
 * @date 2025
 *
 * The AST covers exactly the OpenQASM 3 subset the exporter produces:
 *
 * - Header: OPENQASM 3; include stdgates.inc;
 * - Definitions: gate, def (subroutine) and opaque (calibration) blocks
 * - Declarations: bit[n] c; qubit[n] q; input float[32] theta;
 * - Statements: gate calls, subroutine calls, barrier, measurement
 *   assignment and single-branch if
 * - Expressions: integer and real literals, identifiers, indexed identifiers
 *
 * Nodes are plain aggregates grouped into closed std::variant sets, built
 * once by ProgramBuilder and never mutated. Leaf nodes render their own
 * canonical text here; Printer folds composite nodes into lines.
 *
 * @see ProgramBuilder.hpp for AST construction
 * @see Printer.hpp for serialization
 *
 * @references
 * - OpenQASM 3.0 Specification: https://openqasm.com/
 */
#pragma once

#include "NumberFormat.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace qexport::qasm3::ast {

// =============================================================================
// Expressions
// =============================================================================

struct Identifier {
    std::string name;
};

struct IntegerLiteral {
    std::int64_t value = 0;
};

/**
 * @brief A real-valued literal, rendered pi-aware unless folding is off.
 */
struct RealLiteral {
    double value = 0.0;
    bool fold_constants = true;
};

/**
 * @brief An identifier with an optional single index: q[0], q_0 or $3.
 */
struct IndexedIdentifier {
    Identifier name;
    std::optional<std::size_t> index;
};

using Expression = std::variant<IntegerLiteral, RealLiteral, Identifier, IndexedIdentifier>;

/**
 * @brief Equality comparison, the only boolean expression emitted.
 */
struct ComparisonExpression {
    Expression left;
    Expression right;
};

// =============================================================================
// Header
// =============================================================================

struct Version {
    std::string number = "3";
};

struct Include {
    std::string filename;
};

struct Header {
    Version version;
    std::vector<Include> includes;
};

// =============================================================================
// Declarations
// =============================================================================

enum class DeclarationKind {
    Bit,
    Qubit
};

struct Designator {
    std::size_t size = 0;
};

/**
 * @brief bit[n] name; or qubit[n] name;
 */
struct RegisterDeclaration {
    DeclarationKind kind = DeclarationKind::Qubit;
    Identifier name;
    Designator designator;
};

/**
 * @brief input float[32] name;
 */
struct InputDeclaration {
    Identifier name;
};

// =============================================================================
// Statements
// =============================================================================

struct QuantumGateCall {
    Identifier name;
    std::vector<Expression> params;
    std::vector<IndexedIdentifier> qubits;
};

struct SubroutineCall {
    Identifier name;
    std::vector<Expression> params;
    std::vector<IndexedIdentifier> qubits;
};

struct QuantumBarrier {
    std::vector<IndexedIdentifier> qubits;
};

struct QuantumMeasurement {
    std::vector<IndexedIdentifier> qubits;
};

/**
 * @brief target = measure source;
 */
struct QuantumMeasurementAssignment {
    IndexedIdentifier target;
    QuantumMeasurement measurement;
};

struct Statement;

struct ProgramBlock {
    std::vector<Statement> statements;
};

/**
 * @brief if (condition){ ... } with no else branch.
 */
struct BranchingStatement {
    ComparisonExpression condition;
    ProgramBlock true_block;
};

struct Statement {
    std::variant<QuantumGateCall,
                 SubroutineCall,
                 QuantumBarrier,
                 QuantumMeasurementAssignment,
                 BranchingStatement> node;
};

// =============================================================================
// Definitions
// =============================================================================

struct QuantumGateSignature {
    Identifier name;
    std::vector<Identifier> params;
    std::vector<Identifier> qubits;
};

/**
 * @brief gate name(params) qubits { body }
 */
struct QuantumGateDefinition {
    QuantumGateSignature signature;
    std::vector<Statement> body;
};

/**
 * @brief A subroutine qubit argument: qubit q_0 or qubit[2] q.
 */
struct QuantumArgument {
    Identifier name;
    std::optional<Designator> designator;
};

/**
 * @brief def name(float[32] params) qubit args { body return; }
 */
struct SubroutineDefinition {
    Identifier name;
    std::vector<Identifier> params;
    std::vector<QuantumArgument> qubits;
    std::vector<Statement> body;
};

/**
 * @brief Calibration-backed gate with no body: opaque name(params) qubits;
 */
struct OpaqueDefinition {
    QuantumGateSignature signature;
};

// =============================================================================
// Program
// =============================================================================

using GlobalStatement = std::variant<QuantumGateDefinition,
                                     SubroutineDefinition,
                                     OpaqueDefinition,
                                     RegisterDeclaration,
                                     InputDeclaration,
                                     Statement>;

struct Program {
    Header header;
    std::vector<GlobalStatement> statements;
};

// =============================================================================
// Leaf Rendering
// =============================================================================

[[nodiscard]] inline std::string toString(const Identifier& node) {
    return node.name;
}

[[nodiscard]] inline std::string toString(const IntegerLiteral& node) {
    return std::to_string(node.value);
}

[[nodiscard]] inline std::string toString(const RealLiteral& node) {
    return formatParameter(node.value, node.fold_constants);
}

[[nodiscard]] inline std::string toString(const IndexedIdentifier& node) {
    if (node.index.has_value()) {
        return fmt::format("{}[{}]", node.name.name, *node.index);
    }
    return node.name.name;
}

[[nodiscard]] inline std::string toString(const Expression& node) {
    return std::visit([](const auto& e) { return toString(e); }, node);
}

[[nodiscard]] inline std::string toString(const ComparisonExpression& node) {
    return toString(node.left) + " == " + toString(node.right);
}

[[nodiscard]] inline std::string toString(const Designator& node) {
    return fmt::format("[{}]", node.size);
}

[[nodiscard]] inline std::string toString(const QuantumArgument& node) {
    if (node.designator.has_value()) {
        return "qubit" + toString(*node.designator) + " " + node.name.name;
    }
    return "qubit " + node.name.name;
}

/// @brief Renders a list as "a, b, c".
template <typename T>
[[nodiscard]] std::string joinList(const std::vector<T>& items,
                                   const std::string& prefix = "") {
    std::vector<std::string> parts;
    parts.reserve(items.size());
    for (const auto& item : items) {
        parts.push_back(prefix + toString(item));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

/// @brief Renders "name(params) qubits" shared by gate calls and signatures.
template <typename Param, typename Qubit>
[[nodiscard]] std::string callText(const Identifier& name,
                                   const std::vector<Param>& params,
                                   const std::vector<Qubit>& qubits) {
    std::string result = name.name;
    if (!params.empty()) {
        result += "(" + joinList(params) + ")";
    }
    if (!qubits.empty()) {
        result += " " + joinList(qubits);
    }
    return result;
}

[[nodiscard]] inline std::string toString(const Version& node) {
    return "OPENQASM " + node.number + ";";
}

[[nodiscard]] inline std::string toString(const Include& node) {
    return "include " + node.filename + ";";
}

[[nodiscard]] inline std::string toString(const RegisterDeclaration& node) {
    const char* keyword = node.kind == DeclarationKind::Bit ? "bit" : "qubit";
    return keyword + toString(node.designator) + " " + node.name.name + ";";
}

[[nodiscard]] inline std::string toString(const InputDeclaration& node) {
    return "input float[32] " + node.name.name + ";";
}

[[nodiscard]] inline std::string toString(const QuantumGateCall& node) {
    return callText(node.name, node.params, node.qubits) + ";";
}

[[nodiscard]] inline std::string toString(const SubroutineCall& node) {
    return callText(node.name, node.params, node.qubits) + ";";
}

[[nodiscard]] inline std::string toString(const QuantumBarrier& node) {
    return "barrier " + joinList(node.qubits) + ";";
}

[[nodiscard]] inline std::string toString(const QuantumMeasurement& node) {
    return "measure " + joinList(node.qubits);
}

[[nodiscard]] inline std::string toString(const QuantumMeasurementAssignment& node) {
    return toString(node.target) + " = " + toString(node.measurement) + ";";
}

/// @brief Opening line of a gate definition, without the brace.
[[nodiscard]] inline std::string toString(const QuantumGateSignature& node) {
    return "gate " + callText(node.name, node.params, node.qubits);
}

[[nodiscard]] inline std::string toString(const OpaqueDefinition& node) {
    return "opaque " +
           callText(node.signature.name, node.signature.params, node.signature.qubits) +
           ";";
}

/// @brief Opening line of a subroutine definition, without the brace.
[[nodiscard]] inline std::string signatureText(const SubroutineDefinition& node) {
    std::string result = "def " + node.name.name;
    if (!node.params.empty()) {
        result += "(" + joinList(node.params, "float[32] ") + ")";
    }
    if (!node.qubits.empty()) {
        result += " " + joinList(node.qubits);
    }
    return result;
}

}  // namespace qexport::qasm3::ast
