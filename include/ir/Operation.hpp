// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Operation.hpp
 * @brief Operations, classical conditions and circuit instructions
 *
 * An Operation is what gets applied (a gate, a barrier, a measurement or a
 * subroutine), optionally carrying a body circuit that defines it. An
 * Instruction places an operation on concrete qubits and clbits and may be
 * guarded by a classical Condition.
 *
 * Operations are immutable and shared through OperationPtr. Every operation
 * gets a unique OperationId when constructed, and that id is its identity:
 * appending the same OperationPtr twice refers to one operation, while two
 * separately built operations are distinct even when they look alike.
 *
 * @see Circuit.hpp for building operations from circuits
 * @see Gate.hpp for the standard gate vocabulary
 */

#pragma once

#include "Gate.hpp"
#include "Parameter.hpp"
#include "Register.hpp"
#include "Types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace qexport::ir {

class Circuit;

/**
 * @brief The closed set of operation kinds.
 */
enum class OperationKind {
    Gate,         ///< Unitary gate, standard or custom
    Barrier,      ///< Scheduling barrier directive
    Measurement,  ///< Qubit measurement into clbits
    Subroutine    ///< Non-unitary composite instruction
};

/**
 * @brief Returns the name of an operation kind as a string.
 */
[[nodiscard]] constexpr std::string_view operationKindName(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::Gate:        return "gate";
        case OperationKind::Barrier:     return "barrier";
        case OperationKind::Measurement: return "measurement";
        case OperationKind::Subroutine:  return "subroutine";
    }
    return "unknown";
}

/**
 * @brief An immutable quantum operation.
 *
 * Example:
 * @code
 * auto h = Operation::standard(StandardGate::H);
 * auto rz = Operation::standard(StandardGate::RZ, {Symbol("theta")});
 * auto m = Operation::measure();
 * @endcode
 */
class Operation {
public:
    /**
     * @brief Constructs an operation.
     * @param kind Operation kind
     * @param name Operation name
     * @param num_qubits Number of qubit operands
     * @param num_clbits Number of clbit operands
     * @param params Parameter values
     * @param body Defining circuit, or nullptr for opaque/builtin operations
     * @param standard Standard gate tag for vocabulary gates
     */
    Operation(OperationKind kind,
              std::string name,
              std::size_t num_qubits,
              std::size_t num_clbits,
              std::vector<ParameterValue> params = {},
              std::shared_ptr<const Circuit> body = nullptr,
              std::optional<StandardGate> standard = std::nullopt)
        : kind_(kind)
        , name_(std::move(name))
        , num_qubits_(num_qubits)
        , num_clbits_(num_clbits)
        , params_(std::move(params))
        , body_(std::move(body))
        , standard_(standard)
        , id_(nextId())
    {}

    // Identity is fixed at construction; share through OperationPtr.
    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;
    Operation(Operation&&) = delete;
    Operation& operator=(Operation&&) = delete;
    ~Operation() noexcept = default;

    // -------------------------------------------------------------------------
    // Factory Methods
    // -------------------------------------------------------------------------

    /**
     * @brief Creates a standard vocabulary gate.
     * @throws std::invalid_argument if the parameter count is wrong
     */
    [[nodiscard]] static std::shared_ptr<const Operation> standard(
        StandardGate gate, std::vector<ParameterValue> params = {}) {
        if (params.size() != numParamsFor(gate)) {
            throw std::invalid_argument(
                "Gate " + std::string(gateName(gate)) + " requires " +
                std::to_string(numParamsFor(gate)) + " parameter(s), got " +
                std::to_string(params.size()));
        }
        return std::make_shared<const Operation>(
            OperationKind::Gate, std::string(gateName(gate)),
            numQubitsFor(gate), 0, std::move(params), nullptr, gate);
    }

    /**
     * @brief Creates a custom gate with no body (an opaque gate).
     * @throws std::invalid_argument if name is empty or num_qubits is 0
     */
    [[nodiscard]] static std::shared_ptr<const Operation> opaque(
        std::string name, std::size_t num_qubits,
        std::vector<ParameterValue> params = {}) {
        if (name.empty()) {
            throw std::invalid_argument("Opaque gate requires a name");
        }
        if (num_qubits == 0) {
            throw std::invalid_argument(
                "Opaque gate '" + name + "' must act on at least 1 qubit");
        }
        return std::make_shared<const Operation>(
            OperationKind::Gate, std::move(name), num_qubits, 0, std::move(params));
    }

    /**
     * @brief Creates a barrier over num_qubits qubits.
     * @throws std::invalid_argument if num_qubits is 0
     */
    [[nodiscard]] static std::shared_ptr<const Operation> barrier(std::size_t num_qubits) {
        if (num_qubits == 0) {
            throw std::invalid_argument("Barrier must span at least 1 qubit");
        }
        return std::make_shared<const Operation>(
            OperationKind::Barrier, "barrier", num_qubits, 0);
    }

    /**
     * @brief Creates a measurement of width qubits into width clbits.
     * @throws std::invalid_argument if width is 0
     */
    [[nodiscard]] static std::shared_ptr<const Operation> measure(std::size_t width = 1) {
        if (width == 0) {
            throw std::invalid_argument("Measurement must have at least 1 qubit");
        }
        return std::make_shared<const Operation>(
            OperationKind::Measurement, "measure", width, width);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] OperationKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::size_t numQubits() const noexcept { return num_qubits_; }
    [[nodiscard]] std::size_t numClbits() const noexcept { return num_clbits_; }

    [[nodiscard]] const std::vector<ParameterValue>& params() const noexcept {
        return params_;
    }

    /// @brief Returns the defining circuit, or nullptr if there is none.
    [[nodiscard]] const Circuit* body() const noexcept { return body_.get(); }

    [[nodiscard]] bool hasBody() const noexcept { return body_ != nullptr; }

    /// @brief Returns the standard gate tag, if this is a vocabulary gate.
    [[nodiscard]] std::optional<StandardGate> standardGate() const noexcept {
        return standard_;
    }

    [[nodiscard]] bool isStandard() const noexcept { return standard_.has_value(); }

    /// @brief Returns the unique identity of this operation.
    [[nodiscard]] OperationId id() const noexcept { return id_; }

    /// @brief Returns a string such as "rz(0.5)" for diagnostics.
    [[nodiscard]] std::string toString() const {
        std::string result = name_;
        if (!params_.empty()) {
            result += "(";
            for (std::size_t i = 0; i < params_.size(); ++i) {
                if (i > 0) result += ", ";
                result += ir::toString(params_[i]);
            }
            result += ")";
        }
        return result;
    }

private:
    OperationKind kind_;
    std::string name_;
    std::size_t num_qubits_;
    std::size_t num_clbits_;
    std::vector<ParameterValue> params_;
    std::shared_ptr<const Circuit> body_;
    std::optional<StandardGate> standard_;
    OperationId id_;

    static OperationId nextId() noexcept {
        static std::atomic<OperationId> counter{0};
        return counter.fetch_add(1, std::memory_order_relaxed);
    }
};

/// @brief Shared handle to an immutable operation.
using OperationPtr = std::shared_ptr<const Operation>;

// =============================================================================
// Conditions
// =============================================================================

/**
 * @brief Comparison used by a classical condition.
 */
enum class ComparisonOp {
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual
};

/**
 * @brief Returns the OpenQASM spelling of a comparison operator.
 */
[[nodiscard]] constexpr std::string_view comparisonSymbol(ComparisonOp op) noexcept {
    switch (op) {
        case ComparisonOp::Equal:        return "==";
        case ComparisonOp::NotEqual:     return "!=";
        case ComparisonOp::Less:         return "<";
        case ComparisonOp::LessEqual:    return "<=";
        case ComparisonOp::Greater:      return ">";
        case ComparisonOp::GreaterEqual: return ">=";
    }
    return "?";
}

/**
 * @brief Guard comparing a classical register or bit against an integer.
 */
class Condition {
public:
    using Target = std::variant<Register, Bit>;

    Condition(Register target, std::int64_t value, ComparisonOp op = ComparisonOp::Equal)
        : target_(std::move(target))
        , value_(value)
        , op_(op)
    {}

    Condition(Bit target, std::int64_t value, ComparisonOp op = ComparisonOp::Equal)
        : target_(std::move(target))
        , value_(value)
        , op_(op)
    {}

    [[nodiscard]] const Target& target() const noexcept { return target_; }
    [[nodiscard]] std::int64_t value() const noexcept { return value_; }
    [[nodiscard]] ComparisonOp op() const noexcept { return op_; }

    [[nodiscard]] std::string toString() const {
        std::string lhs = std::holds_alternative<Register>(target_)
                              ? std::get<Register>(target_).name()
                              : std::get<Bit>(target_).toString();
        return lhs + " " + std::string(comparisonSymbol(op_)) + " " +
               std::to_string(value_);
    }

private:
    Target target_;
    std::int64_t value_;
    ComparisonOp op_;
};

// =============================================================================
// Instructions
// =============================================================================

/**
 * @brief An operation applied to concrete bits, optionally conditioned.
 *
 * Instructions are value types; the operation they refer to is shared.
 */
class Instruction {
public:
    Instruction(OperationPtr operation,
                std::vector<Bit> qubits,
                std::vector<Bit> clbits = {},
                std::optional<Condition> condition = std::nullopt)
        : operation_(std::move(operation))
        , qubits_(std::move(qubits))
        , clbits_(std::move(clbits))
        , condition_(std::move(condition))
    {
        if (!operation_) {
            throw std::invalid_argument("Instruction requires an operation");
        }
    }

    [[nodiscard]] const Operation& operation() const noexcept { return *operation_; }
    [[nodiscard]] const OperationPtr& operationPtr() const noexcept { return operation_; }
    [[nodiscard]] const std::vector<Bit>& qubits() const noexcept { return qubits_; }
    [[nodiscard]] const std::vector<Bit>& clbits() const noexcept { return clbits_; }

    [[nodiscard]] const std::optional<Condition>& condition() const noexcept {
        return condition_;
    }

    /// @brief Returns a copy of this instruction with its condition cleared.
    [[nodiscard]] Instruction withoutCondition() const {
        return Instruction(operation_, qubits_, clbits_);
    }

    /// @brief Returns a string such as "cx q[0], q[1]" for diagnostics.
    [[nodiscard]] std::string toString() const {
        std::string result = operation_->toString();
        const char* separator = " ";
        for (const auto& bit : qubits_) {
            result += separator + bit.toString();
            separator = ", ";
        }
        for (const auto& bit : clbits_) {
            result += separator + bit.toString();
            separator = ", ";
        }
        if (condition_.has_value()) {
            result += " if (" + condition_->toString() + ")";
        }
        return result;
    }

private:
    OperationPtr operation_;
    std::vector<Bit> qubits_;
    std::vector<Bit> clbits_;
    std::optional<Condition> condition_;
};

}  // namespace qexport::ir
