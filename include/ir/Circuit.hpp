// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Circuit.hpp
 * @brief Quantum circuit container and operations
 *
 * Provides the Circuit class for building quantum circuits. A circuit owns
 * ordered quantum and classical registers and an ordered instruction list.
 * Circuits double as definitions: toGate() and toInstruction() wrap a copy
 * of the circuit as the body of a new composite operation.
 *
 * @see Operation.hpp for operations and instructions
 * @see Register.hpp for bits and registers
 */

#pragma once

#include "Gate.hpp"
#include "Operation.hpp"
#include "Parameter.hpp"
#include "Register.hpp"
#include "Types.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace qexport::ir {

/**
 * @brief A quantum circuit consisting of registers and instructions.
 *
 * Example:
 * @code
 * Circuit circuit(2, 2);  // registers q[2] and c[2]
 * circuit.addGate(StandardGate::H, {circuit.qubit(0)});
 * circuit.addGate(StandardGate::CX, {circuit.qubit(0), circuit.qubit(1)});
 * circuit.measure(circuit.qubit(0), circuit.clbit(0));
 * @endcode
 */
class Circuit {
public:
    using const_iterator = std::vector<Instruction>::const_iterator;

    /**
     * @brief Constructs an empty circuit with no registers.
     * @param name Circuit name, used when the circuit becomes a definition
     */
    explicit Circuit(std::string name = "circuit")
        : name_(std::move(name))
    {}

    /**
     * @brief Constructs a circuit with a quantum register "q" and, if
     * num_clbits > 0, a classical register "c".
     * @param num_qubits Size of register q
     * @param num_clbits Size of register c
     * @param name Circuit name
     */
    Circuit(std::size_t num_qubits, std::size_t num_clbits,
            std::string name = "circuit")
        : name_(std::move(name))
    {
        if (num_qubits > 0) {
            addRegister(Register::quantum("q", num_qubits));
        }
        if (num_clbits > 0) {
            addRegister(Register::classical("c", num_clbits));
        }
    }

    // Move semantics (circuits can be large)
    Circuit(Circuit&&) noexcept = default;
    Circuit& operator=(Circuit&&) noexcept = default;

    // Delete copy (use clone() if needed)
    Circuit(const Circuit&) = delete;
    Circuit& operator=(const Circuit&) = delete;

    ~Circuit() noexcept = default;

    // -------------------------------------------------------------------------
    // Registers
    // -------------------------------------------------------------------------

    /**
     * @brief Adds a register to the circuit.
     * @param reg The register to add
     * @return The added register
     * @throws std::invalid_argument if a register with the same name exists
     */
    const Register& addRegister(Register reg) {
        if (findRegister(reg.name()) != nullptr) {
            throw std::invalid_argument(
                "Register '" + reg.name() + "' already exists in circuit '" +
                name_ + "'");
        }
        auto& target = reg.kind() == BitKind::Quantum ? qregs_ : cregs_;
        target.push_back(std::move(reg));
        return target.back();
    }

    /// @brief Returns the quantum registers in registration order.
    [[nodiscard]] const std::vector<Register>& qregs() const noexcept { return qregs_; }

    /// @brief Returns the classical registers in registration order.
    [[nodiscard]] const std::vector<Register>& cregs() const noexcept { return cregs_; }

    /**
     * @brief Finds a register of either kind by name.
     * @return Pointer to the register, or nullptr if absent
     */
    [[nodiscard]] const Register* findRegister(const std::string& name) const noexcept {
        for (const auto* regs : {&qregs_, &cregs_}) {
            auto it = std::find_if(regs->begin(), regs->end(),
                                   [&](const Register& r) { return r.name() == name; });
            if (it != regs->end()) {
                return &*it;
            }
        }
        return nullptr;
    }

    /**
     * @brief Returns the index-th qubit counting across quantum registers.
     * @throws std::out_of_range if index >= numQubits()
     */
    [[nodiscard]] Bit qubit(std::size_t index) const {
        return flatBit(qregs_, index, "Qubit");
    }

    /**
     * @brief Returns the index-th clbit counting across classical registers.
     * @throws std::out_of_range if index >= numClbits()
     */
    [[nodiscard]] Bit clbit(std::size_t index) const {
        return flatBit(cregs_, index, "Clbit");
    }

    // -------------------------------------------------------------------------
    // Instruction Management
    // -------------------------------------------------------------------------

    /**
     * @brief Appends an instruction to the circuit.
     * @param instruction The instruction to append
     * @throws std::invalid_argument if operand counts or kinds are wrong
     * @throws std::out_of_range if a bit is outside its register
     *
     * Condition targets are not checked here; exporters validate them.
     */
    void append(Instruction instruction) {
        validateInstruction(instruction);
        instructions_.push_back(std::move(instruction));
    }

    /// @brief Appends operation on the given bits.
    void append(OperationPtr operation,
                std::vector<Bit> qubits,
                std::vector<Bit> clbits = {},
                std::optional<Condition> condition = std::nullopt) {
        append(Instruction(std::move(operation), std::move(qubits),
                           std::move(clbits), std::move(condition)));
    }

    /// @brief Appends a standard gate.
    void addGate(StandardGate gate,
                 std::vector<Bit> qubits,
                 std::vector<ParameterValue> params = {}) {
        append(Operation::standard(gate, std::move(params)), std::move(qubits));
    }

    /// @brief Appends a single-qubit measurement.
    void measure(const Bit& qubit, const Bit& clbit) {
        append(Operation::measure(), {qubit}, {clbit});
    }

    /// @brief Appends a barrier over the given qubits.
    void barrier(std::vector<Bit> qubits) {
        const std::size_t width = qubits.size();
        append(Operation::barrier(width), std::move(qubits));
    }

    /// @brief Appends a barrier over every qubit in the circuit.
    void barrier() {
        std::vector<Bit> all;
        for (const auto& reg : qregs_) {
            for (BitIndex i = 0; i < reg.size(); ++i) {
                all.push_back(reg[i]);
            }
        }
        barrier(std::move(all));
    }

    /// @brief Returns all instructions in application order.
    [[nodiscard]] const std::vector<Instruction>& instructions() const noexcept {
        return instructions_;
    }

    // -------------------------------------------------------------------------
    // Circuit Properties
    // -------------------------------------------------------------------------

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// @brief Returns the total number of qubits across quantum registers.
    [[nodiscard]] std::size_t numQubits() const noexcept { return totalSize(qregs_); }

    /// @brief Returns the total number of clbits across classical registers.
    [[nodiscard]] std::size_t numClbits() const noexcept { return totalSize(cregs_); }

    /// @brief Returns the number of instructions.
    [[nodiscard]] std::size_t size() const noexcept { return instructions_.size(); }

    /// @brief Returns true if the circuit has no instructions.
    [[nodiscard]] bool empty() const noexcept { return instructions_.empty(); }

    /**
     * @brief Returns the unbound symbols used by this circuit's instructions.
     *
     * Each symbol appears once, in order of first use. Symbols used only
     * inside the bodies of composite operations are not included; those
     * belong to the body circuits.
     */
    [[nodiscard]] std::vector<Symbol> parameters() const {
        std::vector<Symbol> result;
        for (const auto& instr : instructions_) {
            for (const auto& param : instr.operation().params()) {
                const auto* symbol = std::get_if<Symbol>(&param);
                if (symbol != nullptr &&
                    std::find(result.begin(), result.end(), *symbol) == result.end()) {
                    result.push_back(*symbol);
                }
            }
        }
        return result;
    }

    // -------------------------------------------------------------------------
    // Conversion to Operations
    // -------------------------------------------------------------------------

    /**
     * @brief Wraps a copy of this circuit as the body of a custom gate.
     * @param arguments Call-site parameter values; defaults to the circuit's
     *                  own unbound symbols
     * @return A new gate operation with its own identity
     * @throws std::invalid_argument if the circuit has classical bits or the
     *         argument count does not match parameters()
     */
    [[nodiscard]] OperationPtr toGate(
        std::optional<std::vector<ParameterValue>> arguments = std::nullopt) const {
        if (numClbits() > 0) {
            throw std::invalid_argument(
                "Circuit '" + name_ + "' has classical bits and cannot become a gate");
        }
        return toOperation(OperationKind::Gate, std::move(arguments));
    }

    /**
     * @brief Wraps a copy of this circuit as the body of a subroutine.
     * @param arguments Call-site parameter values; defaults to the circuit's
     *                  own unbound symbols
     * @return A new subroutine operation with its own identity
     * @throws std::invalid_argument if the argument count does not match
     */
    [[nodiscard]] OperationPtr toInstruction(
        std::optional<std::vector<ParameterValue>> arguments = std::nullopt) const {
        return toOperation(OperationKind::Subroutine, std::move(arguments));
    }

    // -------------------------------------------------------------------------
    // Iteration
    // -------------------------------------------------------------------------

    [[nodiscard]] const_iterator begin() const noexcept { return instructions_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return instructions_.end(); }

    // -------------------------------------------------------------------------
    // Utilities
    // -------------------------------------------------------------------------

    /**
     * @brief Creates a copy of the circuit.
     *
     * Instructions are copied; the operations they refer to are shared, so
     * identities are preserved.
     */
    [[nodiscard]] Circuit clone() const {
        Circuit copy(name_);
        copy.qregs_ = qregs_;
        copy.cregs_ = cregs_;
        copy.instructions_ = instructions_;
        return copy;
    }

    /**
     * @brief Returns a string representation of the circuit.
     * @return Multi-line string showing circuit structure
     */
    [[nodiscard]] std::string toString() const {
        std::string result = "Circuit '" + name_ + "' (" +
                             std::to_string(numQubits()) + " qubits, " +
                             std::to_string(numClbits()) + " clbits, " +
                             std::to_string(instructions_.size()) + " instructions):\n";
        for (const auto& instr : instructions_) {
            result += "  " + instr.toString() + "\n";
        }
        return result;
    }

private:
    std::string name_;
    std::vector<Register> qregs_;
    std::vector<Register> cregs_;
    std::vector<Instruction> instructions_;

    static std::size_t totalSize(const std::vector<Register>& regs) noexcept {
        std::size_t total = 0;
        for (const auto& reg : regs) {
            total += reg.size();
        }
        return total;
    }

    static Bit flatBit(const std::vector<Register>& regs, std::size_t index,
                       const char* what) {
        std::size_t remaining = index;
        for (const auto& reg : regs) {
            if (remaining < reg.size()) {
                return reg[remaining];
            }
            remaining -= reg.size();
        }
        throw std::out_of_range(
            std::string(what) + " index " + std::to_string(index) +
            " out of range [0, " + std::to_string(totalSize(regs)) + ")");
    }

    OperationPtr toOperation(OperationKind kind,
                             std::optional<std::vector<ParameterValue>> arguments) const {
        const auto formals = parameters();
        std::vector<ParameterValue> params;
        if (arguments.has_value()) {
            if (arguments->size() != formals.size()) {
                throw std::invalid_argument(
                    "Circuit '" + name_ + "' takes " + std::to_string(formals.size()) +
                    " parameter(s), got " + std::to_string(arguments->size()));
            }
            params = std::move(*arguments);
        } else {
            params.assign(formals.begin(), formals.end());
        }
        auto body = std::make_shared<const Circuit>(clone());
        return std::make_shared<const Operation>(
            kind, name_, numQubits(), numClbits(), std::move(params), std::move(body));
    }

    void validateBit(const Bit& bit, BitKind expected, const Instruction& instr) const {
        if (bit.kind() != expected) {
            throw std::invalid_argument(
                "Instruction " + instr.operation().name() + " expects a " +
                std::string(bitKindName(expected)) + " operand, got " +
                bit.toString());
        }
        if (bit.isAnonymous()) {
            return;
        }
        const Register* reg = findRegister(*bit.registerName());
        if (reg == nullptr || reg->kind() != expected) {
            throw std::out_of_range(
                "Instruction " + instr.operation().name() + " references " +
                bit.toString() + " but circuit '" + name_ +
                "' has no such register");
        }
        if (!reg->contains(bit)) {
            throw std::out_of_range(
                "Instruction " + instr.operation().name() + " references " +
                bit.toString() + " but register '" + reg->name() + "' has only " +
                std::to_string(reg->size()) + " bits");
        }
    }

    /**
     * @brief Validates operand counts, kinds and membership.
     */
    void validateInstruction(const Instruction& instr) const {
        const Operation& op = instr.operation();
        if (instr.qubits().size() != op.numQubits()) {
            throw std::invalid_argument(
                "Instruction " + op.name() + " requires " +
                std::to_string(op.numQubits()) + " qubit(s), got " +
                std::to_string(instr.qubits().size()));
        }
        if (instr.clbits().size() != op.numClbits()) {
            throw std::invalid_argument(
                "Instruction " + op.name() + " requires " +
                std::to_string(op.numClbits()) + " clbit(s), got " +
                std::to_string(instr.clbits().size()));
        }
        for (std::size_t i = 0; i < instr.qubits().size(); ++i) {
            validateBit(instr.qubits()[i], BitKind::Quantum, instr);
            for (std::size_t j = 0; j < i; ++j) {
                if (instr.qubits()[i] == instr.qubits()[j]) {
                    throw std::invalid_argument(
                        "Instruction " + op.name() + " uses qubit " +
                        instr.qubits()[i].toString() + " more than once");
                }
            }
        }
        for (const auto& bit : instr.clbits()) {
            validateBit(bit, BitKind::Classical, instr);
        }
    }
};

/**
 * @brief Stream output operator for Circuit.
 * @param os Output stream
 * @param circuit The circuit to output
 * @return Reference to the output stream
 */
inline std::ostream& operator<<(std::ostream& os, const Circuit& circuit) {
    os << circuit.toString();
    return os;
}

}  // namespace qexport::ir
