// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file ExportError.hpp
 * @brief Error types for OpenQASM 3 export
 * @author Rylan Malarchick
 * @date 2025
 *
 * Provides structured error reporting for circuits that cannot be exported,
 * identifying the offending instruction in the message.
 *
 * @see Exporter.hpp for the export entry points
 */
#pragma once

#include "ir/Operation.hpp"

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace qexport::qasm3 {

/**
 * @brief Category of export error.
 */
enum class ExportErrorKind {
    UnsupportedConstruct,  ///< Valid input the exporter cannot lower
    MalformedInput,        ///< Input violating the read contract
};

/**
 * @brief Get string representation of error kind.
 */
[[nodiscard]] constexpr std::string_view errorKindName(ExportErrorKind kind) noexcept {
    switch (kind) {
        case ExportErrorKind::UnsupportedConstruct: return "unsupported construct";
        case ExportErrorKind::MalformedInput:       return "malformed input";
    }
    return "error";
}

/**
 * @brief A single export error.
 *
 * Contains the error category, message and, when known, a description of
 * the instruction being lowered.
 */
class ExportError {
public:
    /**
     * @brief Construct an error not tied to an instruction.
     * @param kind Error category
     * @param message Description of the error
     */
    ExportError(ExportErrorKind kind, std::string message)
        : kind_(kind)
        , message_(std::move(message)) {}

    /**
     * @brief Construct an error for an instruction.
     * @param kind Error category
     * @param message Description of the error
     * @param instruction Instruction being lowered
     */
    ExportError(ExportErrorKind kind, std::string message,
                const ir::Instruction& instruction)
        : kind_(kind)
        , message_(std::move(message))
        , instruction_(instruction.toString()) {}

    // Accessors
    [[nodiscard]] ExportErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& instruction() const noexcept { return instruction_; }

    /**
     * @brief Format the error as a string.
     *
     * Format: "error_kind: message (in 'instruction')"
     */
    [[nodiscard]] std::string format() const {
        std::string result = std::string(errorKindName(kind_)) + ": " + message_;
        if (!instruction_.empty()) {
            result += " (in '" + instruction_ + "')";
        }
        return result;
    }

private:
    ExportErrorKind kind_;
    std::string message_;
    std::string instruction_;
};

/**
 * @brief Stream output for ExportError.
 */
inline std::ostream& operator<<(std::ostream& os, const ExportError& error) {
    os << error.format();
    return os;
}

/**
 * @brief Exception thrown when export fails.
 *
 * Inherits from std::runtime_error for compatibility with
 * standard exception handling.
 */
class QASMExportException : public std::runtime_error {
public:
    explicit QASMExportException(ExportError error)
        : std::runtime_error(error.format())
        , error_(std::move(error)) {}

    [[nodiscard]] const ExportError& error() const noexcept { return error_; }
    [[nodiscard]] ExportErrorKind kind() const noexcept { return error_.kind(); }

private:
    ExportError error_;
};

/**
 * @brief Helper to create an unsupported-construct error.
 */
[[nodiscard]] inline ExportError unsupportedConstruct(
    const std::string& message,
    const ir::Instruction& instruction) {
    return ExportError(ExportErrorKind::UnsupportedConstruct, message, instruction);
}

/**
 * @brief Helper to create a malformed-input error for an instruction.
 */
[[nodiscard]] inline ExportError malformedInput(
    const std::string& message,
    const ir::Instruction& instruction) {
    return ExportError(ExportErrorKind::MalformedInput, message, instruction);
}

/**
 * @brief Helper to create a malformed-input error.
 */
[[nodiscard]] inline ExportError malformedInput(const std::string& message) {
    return ExportError(ExportErrorKind::MalformedInput, message);
}

}  // namespace qexport::qasm3
