// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Parameter.hpp
 * @brief Gate parameter values: bound reals and unbound symbols
 */

#pragma once

#include "Types.hpp"

#include <string>
#include <variant>

namespace qexport::ir {

/**
 * @brief A named, unbound parameter such as theta.
 *
 * Symbols are compared by name.
 */
class Symbol {
public:
    explicit Symbol(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] bool operator==(const Symbol& other) const noexcept {
        return name_ == other.name_;
    }

    [[nodiscard]] bool operator!=(const Symbol& other) const noexcept {
        return !(*this == other);
    }

private:
    std::string name_;
};

/// @brief A gate parameter: either a bound real value or an unbound symbol.
using ParameterValue = std::variant<Angle, Symbol>;

/// @brief Returns a debug string for a parameter.
[[nodiscard]] inline std::string toString(const ParameterValue& value) {
    if (const auto* symbol = std::get_if<Symbol>(&value)) {
        return symbol->name();
    }
    return std::to_string(std::get<Angle>(value));
}

}  // namespace qexport::ir
