// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file DeclarationHoister.hpp
 * @brief Discovers the definitions a circuit needs, callees first
 *
 * The hoister walks a circuit's instructions depth-first and registers every
 * operation that needs an explicit definition block in the GlobalNamespace.
 * An operation's body is walked before the operation itself is registered
 * (post-order), so the resulting list is already in dependency order: every
 * definition precedes the definitions that call it.
 *
 * @see GlobalNamespace.hpp for name assignment
 * @see ProgramBuilder.hpp for how hoisted definitions are emitted
 */

#pragma once

#include "ExportError.hpp"
#include "GlobalNamespace.hpp"
#include "ir/Circuit.hpp"
#include "ir/Operation.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <string_view>
#include <vector>

namespace qexport::qasm3 {

/**
 * @brief How a hoisted operation is declared.
 */
enum class DefinitionKind {
    Gate,        ///< gate block (unitary body)
    Subroutine,  ///< def block (non-unitary body)
    Opaque       ///< opaque declaration (no body)
};

[[nodiscard]] constexpr std::string_view definitionKindName(DefinitionKind kind) noexcept {
    switch (kind) {
        case DefinitionKind::Gate:       return "gate";
        case DefinitionKind::Subroutine: return "subroutine";
        case DefinitionKind::Opaque:     return "opaque";
    }
    return "unknown";
}

/**
 * @brief An operation that needs a definition, with its output name.
 */
struct HoistedDefinition {
    ir::OperationPtr operation;
    DefinitionKind kind;
    std::string name;
};

/**
 * @brief Post-order collector of definitions.
 *
 * Example:
 * @code
 * GlobalNamespace ns({"stdgates.inc"});
 * DeclarationHoister hoister(ns);
 * hoister.hoist(circuit.instructions());
 * for (const auto& def : hoister.definitions()) { ... }
 * @endcode
 *
 * Thread safety: Not thread-safe. Create one hoister per export.
 */
class DeclarationHoister {
public:
    /**
     * @brief Construct a hoister registering into the given namespace.
     * @param ns Namespace; must outlive the hoister
     */
    explicit DeclarationHoister(GlobalNamespace& ns) : namespace_(ns) {}

    /**
     * @brief Walk instructions and collect their definitions.
     * @throws QASMExportException for operations outside the closed kind set
     *
     * May be called repeatedly; already registered operations are skipped.
     */
    void hoist(const std::vector<ir::Instruction>& instructions) {
        for (const auto& instr : instructions) {
            visit(instr);
        }
    }

    /// @brief Definitions in dependency order (callees first).
    [[nodiscard]] const std::vector<HoistedDefinition>& definitions() const noexcept {
        return definitions_;
    }

private:
    GlobalNamespace& namespace_;
    std::vector<HoistedDefinition> definitions_;

    void visit(const ir::Instruction& instr) {
        const ir::Operation& op = instr.operation();
        switch (op.kind()) {
            case ir::OperationKind::Barrier:
            case ir::OperationKind::Measurement:
                return;
            case ir::OperationKind::Gate:
            case ir::OperationKind::Subroutine:
                break;
            default:
                throw QASMExportException(
                    unsupportedConstruct("unknown operation kind", instr));
        }

        if (namespace_.exists(op)) {
            return;
        }

        if (!op.hasBody()) {
            add(instr.operationPtr(), DefinitionKind::Opaque);
            return;
        }

        hoist(op.body()->instructions());
        add(instr.operationPtr(), op.kind() == ir::OperationKind::Gate
                                      ? DefinitionKind::Gate
                                      : DefinitionKind::Subroutine);
    }

    void add(const ir::OperationPtr& op, DefinitionKind kind) {
        std::string name = namespace_.registerOperation(*op);
        spdlog::debug("qasm3: hoisted {} definition '{}'", definitionKindName(kind), name);
        definitions_.push_back({op, kind, std::move(name)});
    }
};

}  // namespace qexport::qasm3
