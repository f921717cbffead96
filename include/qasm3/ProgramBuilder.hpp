// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file ProgramBuilder.hpp
 * @brief Lowers a circuit into an OpenQASM 3 AST
 * @author Rylan Malarchick
 * @date 2025
 *
 * The builder runs the export pipeline up to (but excluding) text output:
 *
 * 1. Validate the circuit's registers
 * 2. Reserve register and input names in the GlobalNamespace
 * 3. Hoist definitions into the GlobalNamespace (callees first)
 * 4. Build, in order: header, definitions, unbound-parameter inputs,
 *    bit declarations, qubit declarations, top-level statements
 *
 * Instruction lowering is shared between the top level and definition
 * bodies. Inside a body, qubits are formal arguments rather than register
 * elements, so they are named "reg_i" instead of "reg[i]"; the naming mode
 * is passed down explicitly with each call.
 *
 * @see DeclarationHoister.hpp for definition discovery
 * @see Printer.hpp for turning the AST into text
 */
#pragma once

#include "Ast.hpp"
#include "DeclarationHoister.hpp"
#include "ExportError.hpp"
#include "GlobalNamespace.hpp"
#include "ir/Circuit.hpp"
#include "ir/Operation.hpp"
#include "ir/Parameter.hpp"
#include "ir/Register.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace qexport::qasm3 {

/**
 * @brief Configuration for one export.
 */
struct ExporterOptions {
    /// Include files emitted after the version line, in order.
    std::vector<std::string> includes{std::string(STDGATES_INCLUDE)};

    /// Render rational multiples of pi symbolically (2*pi, pi/2).
    bool fold_constants = true;
};

/**
 * @brief How bits are named while lowering instructions.
 */
enum class NamingMode {
    Indexed,  ///< Register element: q[0]
    Flat      ///< Formal argument of a definition: q_0
};

/**
 * @brief Builds the AST for a single circuit.
 *
 * Usage:
 * @code
 * ProgramBuilder builder(circuit, ExporterOptions{});
 * ast::Program program = builder.build();
 * @endcode
 *
 * Thread safety: Not thread-safe. Each export should use its own builder.
 */
class ProgramBuilder {
public:
    /**
     * @brief Construct a builder for the given circuit.
     * @param circuit Circuit to export; must outlive the builder
     * @param options Export configuration
     */
    ProgramBuilder(const ir::Circuit& circuit, ExporterOptions options)
        : circuit_(circuit)
        , options_(std::move(options))
        , namespace_(options_.includes)
        , hoister_(namespace_) {}

    ProgramBuilder(const ProgramBuilder&) = delete;
    ProgramBuilder& operator=(const ProgramBuilder&) = delete;

    /**
     * @brief Build the complete program.
     * @return The program AST
     * @throws QASMExportException on unsupported or malformed input
     */
    [[nodiscard]] ast::Program build() {
        spdlog::debug("qasm3: exporting circuit '{}' ({} instructions)",
                      circuit_.name(), circuit_.size());

        validateRegisters(circuit_);
        reserveGlobalIdentifiers();
        hoister_.hoist(circuit_.instructions());

        ast::Program program;
        program.header = buildHeader();

        for (const auto& def : hoister_.definitions()) {
            program.statements.push_back(buildDefinition(def));
        }
        for (const auto& symbol : circuit_.parameters()) {
            program.statements.push_back(ast::InputDeclaration{{symbol.name()}});
        }
        for (const auto& creg : circuit_.cregs()) {
            program.statements.push_back(buildDeclaration(ast::DeclarationKind::Bit, creg));
        }
        for (const auto& qreg : circuit_.qregs()) {
            program.statements.push_back(buildDeclaration(ast::DeclarationKind::Qubit, qreg));
        }
        for (auto& statement : buildInstructions(circuit_, NamingMode::Indexed)) {
            program.statements.push_back(std::move(statement));
        }

        spdlog::debug("qasm3: built {} global statements, {} definitions",
                      program.statements.size(), hoister_.definitions().size());
        return program;
    }

    /// @brief The namespace populated by build().
    [[nodiscard]] const GlobalNamespace& globalNamespace() const noexcept {
        return namespace_;
    }

    /// @brief Definitions hoisted by build(), callees first.
    [[nodiscard]] const std::vector<HoistedDefinition>& definitions() const noexcept {
        return hoister_.definitions();
    }

private:
    const ir::Circuit& circuit_;
    ExporterOptions options_;
    GlobalNamespace namespace_;
    DeclarationHoister hoister_;

    // =========================================================================
    // Header and Declarations
    // =========================================================================

    [[nodiscard]] ast::Header buildHeader() const {
        ast::Header header;
        for (const auto& filename : options_.includes) {
            header.includes.push_back(ast::Include{filename});
        }
        return header;
    }

    /**
     * @brief Reject registers that cannot be declared.
     */
    static void validateRegisters(const ir::Circuit& circuit) {
        for (const auto* regs : {&circuit.qregs(), &circuit.cregs()}) {
            for (const auto& reg : *regs) {
                if (reg.name().empty()) {
                    throw QASMExportException(malformedInput(
                        "unnamed register in circuit '" + circuit.name() + "'"));
                }
                if (reg.size() == 0) {
                    throw QASMExportException(malformedInput(
                        "register '" + reg.name() + "' has no designator size"));
                }
            }
        }
    }

    void reserveGlobalIdentifiers() {
        for (const auto* regs : {&circuit_.qregs(), &circuit_.cregs()}) {
            for (const auto& reg : *regs) {
                namespace_.reserve(reg.name());
            }
        }
        for (const auto& symbol : circuit_.parameters()) {
            namespace_.reserve(symbol.name());
        }
    }

    [[nodiscard]] static ast::RegisterDeclaration buildDeclaration(
        ast::DeclarationKind kind, const ir::Register& reg) {
        return ast::RegisterDeclaration{kind, {reg.name()}, {reg.size()}};
    }

    // =========================================================================
    // Definitions
    // =========================================================================

    [[nodiscard]] ast::GlobalStatement buildDefinition(const HoistedDefinition& def) const {
        switch (def.kind) {
            case DefinitionKind::Gate:       return buildGateDefinition(def);
            case DefinitionKind::Subroutine: return buildSubroutineDefinition(def);
            case DefinitionKind::Opaque:     return buildOpaqueDefinition(def);
        }
        throw QASMExportException(malformedInput(
            "unknown definition kind for '" + def.name + "'"));
    }

    /// @brief Formal qubit names of a body: one "reg_i" per qubit.
    [[nodiscard]] static std::vector<ast::Identifier> formalQubits(const ir::Circuit& body) {
        std::vector<ast::Identifier> result;
        for (const auto& qreg : body.qregs()) {
            for (BitIndex i = 0; i < qreg.size(); ++i) {
                result.push_back({flatName(qreg.name(), i)});
            }
        }
        return result;
    }

    [[nodiscard]] static std::vector<ast::Identifier> formalParams(const ir::Circuit& body) {
        std::vector<ast::Identifier> result;
        for (const auto& symbol : body.parameters()) {
            result.push_back({symbol.name()});
        }
        return result;
    }

    [[nodiscard]] ast::QuantumGateDefinition buildGateDefinition(
        const HoistedDefinition& def) const {
        const ir::Circuit& body = *def.operation->body();
        validateRegisters(body);

        ast::QuantumGateDefinition result;
        result.signature = {{def.name}, formalParams(body), formalQubits(body)};
        result.body = buildInstructions(body, NamingMode::Flat);
        return result;
    }

    [[nodiscard]] ast::SubroutineDefinition buildSubroutineDefinition(
        const HoistedDefinition& def) const {
        const ir::Circuit& body = *def.operation->body();
        validateRegisters(body);

        ast::SubroutineDefinition result;
        result.name = {def.name};
        result.params = formalParams(body);
        for (auto& qubit : formalQubits(body)) {
            result.qubits.push_back({std::move(qubit), std::nullopt});
        }
        result.body = buildInstructions(body, NamingMode::Flat);
        return result;
    }

    [[nodiscard]] static ast::OpaqueDefinition buildOpaqueDefinition(
        const HoistedDefinition& def) {
        const ir::Operation& op = *def.operation;
        ast::OpaqueDefinition result;
        result.signature.name = {def.name};
        for (std::size_t i = 0; i < op.params().size(); ++i) {
            result.signature.params.push_back({"param_" + std::to_string(i)});
        }
        for (std::size_t i = 0; i < op.numQubits(); ++i) {
            result.signature.qubits.push_back({"q_" + std::to_string(i)});
        }
        return result;
    }

    // =========================================================================
    // Instructions
    // =========================================================================

    [[nodiscard]] std::vector<ast::Statement> buildInstructions(
        const ir::Circuit& scope, NamingMode mode) const {
        std::vector<ast::Statement> result;
        result.reserve(scope.size());
        for (const auto& instr : scope.instructions()) {
            result.push_back(buildInstruction(instr, scope, mode));
        }
        return result;
    }

    /**
     * @brief Lower one instruction.
     *
     * A conditioned instruction becomes if (target == value){ ... } around
     * the same instruction with its condition cleared.
     */
    [[nodiscard]] ast::Statement buildInstruction(
        const ir::Instruction& instr, const ir::Circuit& scope, NamingMode mode) const {
        const ir::Operation& op = instr.operation();

        if (instr.condition().has_value()) {
            if (op.kind() == ir::OperationKind::Barrier) {
                throw QASMExportException(
                    unsupportedConstruct("barrier cannot be conditioned", instr));
            }
            ast::BranchingStatement branch{
                buildEqCondition(*instr.condition(), instr, scope, mode), {}};
            branch.true_block.statements.push_back(
                buildInstruction(instr.withoutCondition(), scope, mode));
            return ast::Statement{std::move(branch)};
        }

        switch (op.kind()) {
            case ir::OperationKind::Gate:
                return ast::Statement{ast::QuantumGateCall{
                    {namespace_.nameOf(op)},
                    buildParams(op),
                    buildIndexedIdentifiers(instr.qubits(), instr, mode)}};
            case ir::OperationKind::Barrier:
                return ast::Statement{ast::QuantumBarrier{
                    buildIndexedIdentifiers(instr.qubits(), instr, mode)}};
            case ir::OperationKind::Measurement:
                return ast::Statement{buildMeasurement(instr, mode)};
            case ir::OperationKind::Subroutine:
                return ast::Statement{ast::SubroutineCall{
                    {namespace_.nameOf(op)},
                    buildParams(op),
                    buildIndexedIdentifiers(instr.qubits(), instr, mode)}};
        }
        throw QASMExportException(unsupportedConstruct("unknown operation kind", instr));
    }

    /**
     * @brief Lower c = measure q; for exactly one qubit and one clbit.
     */
    [[nodiscard]] ast::QuantumMeasurementAssignment buildMeasurement(
        const ir::Instruction& instr, NamingMode mode) const {
        if (instr.qubits().size() != 1 || instr.clbits().size() != 1) {
            throw QASMExportException(unsupportedConstruct(
                "measurement must assign exactly one clbit from one qubit, got " +
                    std::to_string(instr.qubits().size()) + " qubit(s) and " +
                    std::to_string(instr.clbits().size()) + " clbit(s)",
                instr));
        }
        return ast::QuantumMeasurementAssignment{
            buildIndexedIdentifier(instr.clbits().front(), instr, mode),
            ast::QuantumMeasurement{buildIndexedIdentifiers(instr.qubits(), instr, mode)}};
    }

    /**
     * @brief Lower a condition to target == value.
     * @throws QASMExportException for non-equality conditions and for
     *         targets that are missing or not declared in scope
     */
    [[nodiscard]] ast::ComparisonExpression buildEqCondition(
        const ir::Condition& condition, const ir::Instruction& instr,
        const ir::Circuit& scope, NamingMode mode) const {
        if (condition.op() != ir::ComparisonOp::Equal) {
            throw QASMExportException(unsupportedConstruct(
                "only '==' conditions are supported, got '" +
                    std::string(ir::comparisonSymbol(condition.op())) + "'",
                instr));
        }

        ast::Expression target;
        if (const auto* reg = std::get_if<ir::Register>(&condition.target())) {
            if (reg->name().empty()) {
                throw QASMExportException(
                    malformedInput("condition has no target register", instr));
            }
            const ir::Register* declared = scope.findRegister(reg->name());
            if (declared == nullptr || declared->kind() != ir::BitKind::Classical) {
                throw QASMExportException(malformedInput(
                    "condition on undeclared classical register '" + reg->name() + "'",
                    instr));
            }
            target = ast::Identifier{reg->name()};
        } else {
            const auto& bit = std::get<ir::Bit>(condition.target());
            if (bit.kind() != ir::BitKind::Classical) {
                throw QASMExportException(malformedInput(
                    "condition target " + bit.toString() + " is not a classical bit",
                    instr));
            }
            target = buildIndexedIdentifier(bit, instr, mode);
        }

        return ast::ComparisonExpression{std::move(target),
                                         ast::IntegerLiteral{condition.value()}};
    }

    [[nodiscard]] std::vector<ast::Expression> buildParams(const ir::Operation& op) const {
        std::vector<ast::Expression> result;
        result.reserve(op.params().size());
        for (const auto& param : op.params()) {
            if (const auto* symbol = std::get_if<ir::Symbol>(&param)) {
                result.push_back(ast::Identifier{symbol->name()});
            } else {
                result.push_back(ast::RealLiteral{std::get<Angle>(param),
                                                  options_.fold_constants});
            }
        }
        return result;
    }

    [[nodiscard]] static std::string flatName(const std::string& reg, BitIndex index) {
        return reg + "_" + std::to_string(index);
    }

    /**
     * @brief Name a bit: reg[i] (indexed), reg_i (flat) or $i (physical).
     * @throws QASMExportException for bits that cannot be addressed
     */
    [[nodiscard]] static ast::IndexedIdentifier buildIndexedIdentifier(
        const ir::Bit& bit, const ir::Instruction& instr, NamingMode mode) {
        if (bit.isAnonymous()) {
            if (bit.kind() == ir::BitKind::Classical) {
                throw QASMExportException(malformedInput(
                    "classical bit " + bit.toString() + " belongs to no register", instr));
            }
            if (mode == NamingMode::Flat) {
                throw QASMExportException(malformedInput(
                    "definition body addresses physical qubit " + bit.toString(), instr));
            }
            return ast::IndexedIdentifier{{bit.toString()}, std::nullopt};
        }

        if (mode == NamingMode::Flat) {
            return ast::IndexedIdentifier{{flatName(*bit.registerName(), bit.index())},
                                          std::nullopt};
        }
        return ast::IndexedIdentifier{{*bit.registerName()}, bit.index()};
    }

    [[nodiscard]] static std::vector<ast::IndexedIdentifier> buildIndexedIdentifiers(
        const std::vector<ir::Bit>& bits, const ir::Instruction& instr, NamingMode mode) {
        std::vector<ast::IndexedIdentifier> result;
        result.reserve(bits.size());
        for (const auto& bit : bits) {
            result.push_back(buildIndexedIdentifier(bit, instr, mode));
        }
        return result;
    }
};

}  // namespace qexport::qasm3
