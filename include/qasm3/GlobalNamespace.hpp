// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file GlobalNamespace.hpp
 * @brief Per-export registry mapping operations to unique output names
 *
 * Custom operations are keyed by identity: the first time an operation is
 * registered it receives the next arena slot, and the slot index is the
 * disambiguator appended when its name is already taken. Standard gates are
 * keyed by name. Once assigned, a name never changes for the lifetime of
 * the namespace.
 *
 * @see DeclarationHoister.hpp for the walk that registers operations
 */

#pragma once

#include "ExportError.hpp"
#include "ir/Gate.hpp"
#include "ir/Operation.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace qexport::qasm3 {

/// @brief Include file that provides the standard gate vocabulary.
inline constexpr std::string_view STDGATES_INCLUDE = "stdgates.inc";

/// @brief Words that can never name a user definition.
inline constexpr std::array<std::string_view, 16> RESERVED_WORDS = {
    "OPENQASM", "include", "gate", "def", "opaque", "if", "else", "return",
    "input", "qubit", "bit", "float", "measure", "barrier", "U", "pi",
};

/**
 * @brief Registry of output names for one export.
 *
 * Example:
 * @code
 * GlobalNamespace ns({"stdgates.inc"});
 * ns.exists(*h_op);                         // true: standard gate
 * auto name = ns.registerOperation(*op);    // "my_gate" or "my_gate_<slot>"
 * @endcode
 *
 * Thread safety: Not thread-safe. Create one namespace per export.
 */
class GlobalNamespace {
public:
    /**
     * @brief Construct a namespace seeded from an include list.
     * @param includes Include filenames; stdgates.inc seeds the standard gates
     */
    explicit GlobalNamespace(const std::vector<std::string>& includes) {
        for (auto word : RESERVED_WORDS) {
            by_name_.emplace(std::string(word), std::nullopt);
        }
        const bool has_stdgates =
            std::find(includes.begin(), includes.end(), STDGATES_INCLUDE) != includes.end();
        if (has_stdgates) {
            for (auto gate : ir::ALL_STANDARD_GATES) {
                if (ir::isLanguageBuiltin(gate)) continue;
                std::string name(ir::gateName(gate));
                by_name_.emplace(name, std::nullopt);
                included_gates_.insert(std::move(name));
            }
        }
    }

    /**
     * @brief Bind a program-level identifier that is not an operation.
     *
     * Register and input names share the program's global scope with
     * definitions; reserving them makes later definitions take a suffix.
     */
    void reserve(const std::string& name) {
        by_name_.emplace(name, std::nullopt);
    }

    /**
     * @brief Check whether an operation already has an output name.
     *
     * True for U, for standard gates provided by an include or already
     * registered by name, and for custom operations registered by identity.
     */
    [[nodiscard]] bool exists(const ir::Operation& op) const {
        if (op.standardGate() == ir::StandardGate::U) {
            return true;
        }
        if (op.isStandard()) {
            return included_gates_.count(op.name()) > 0 ||
                   standard_slots_.count(op.name()) > 0;
        }
        return slots_.count(op.id()) > 0;
    }

    /**
     * @brief Check whether an operation is provided without a definition.
     */
    [[nodiscard]] bool isBuiltin(const ir::Operation& op) const {
        return op.standardGate() == ir::StandardGate::U ||
               (op.isStandard() && included_gates_.count(op.name()) > 0);
    }

    /**
     * @brief Bind an operation to a unique output name.
     * @param op The operation
     * @return The name bound to op
     * @throws QASMExportException if op has an empty name
     *
     * Registering an operation that already exists returns its existing
     * name. If op's own name is taken by anything else, the slot index is
     * appended ("name_<slot>") until the result is free.
     */
    std::string registerOperation(const ir::Operation& op) {
        if (exists(op)) {
            return nameOf(op);
        }
        if (op.name().empty()) {
            throw QASMExportException(malformedInput(
                "cannot register an unnamed " +
                std::string(ir::operationKindName(op.kind()))));
        }

        const std::size_t slot = names_.size();
        std::string name = op.name();
        while (by_name_.count(name) > 0) {
            name += "_" + std::to_string(slot);
        }
        if (name != op.name()) {
            spdlog::debug("qasm3: name '{}' already bound, using '{}'", op.name(), name);
        }

        by_name_.emplace(name, slot);
        names_.push_back(name);
        if (op.isStandard()) {
            standard_slots_.emplace(op.name(), slot);
        } else {
            slots_.emplace(op.id(), slot);
        }
        return name;
    }

    /**
     * @brief Get the output name of an operation.
     * @throws QASMExportException if op was never registered
     */
    [[nodiscard]] std::string nameOf(const ir::Operation& op) const {
        if (isBuiltin(op)) {
            return op.name();
        }
        if (auto slot = slotOf(op)) {
            return names_[*slot];
        }
        throw QASMExportException(malformedInput(
            "operation '" + op.name() + "' has no definition in scope"));
    }

    /**
     * @brief Get the arena slot of a registered, non-builtin operation.
     */
    [[nodiscard]] std::optional<std::size_t> slotOf(const ir::Operation& op) const {
        if (op.isStandard()) {
            auto it = standard_slots_.find(op.name());
            if (it != standard_slots_.end()) return it->second;
            return std::nullopt;
        }
        auto it = slots_.find(op.id());
        if (it != slots_.end()) return it->second;
        return std::nullopt;
    }

    /**
     * @brief Check whether a name is bound (reserved, included or registered).
     */
    [[nodiscard]] bool isBound(const std::string& name) const {
        return by_name_.count(name) > 0;
    }

    /// @brief Number of operations registered (excludes seeded names).
    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

private:
    // name -> slot; std::nullopt for reserved words, included gates and
    // reserved program identifiers
    std::unordered_map<std::string, std::optional<std::size_t>> by_name_;
    std::unordered_set<std::string> included_gates_;

    // Arena: slot -> name, keyed by identity (custom) or by name (standard)
    std::vector<std::string> names_;
    std::unordered_map<OperationId, std::size_t> slots_;
    std::unordered_map<std::string, std::size_t> standard_slots_;
};

}  // namespace qexport::qasm3
