// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Exporter.hpp
 * @brief OpenQASM 3 export entry points
 * @author Rylan Malarchick
 * @date 2025
 *
 * Serializes an ir::Circuit into an OpenQASM 3 program. Each call builds a
 * fresh namespace, definition list and AST, so exporting the same circuit
 * twice yields identical text. The AST is complete before any text is
 * written: on error nothing reaches the output stream.
 *
 * Example:
 * @code
 * Circuit circuit(1, 1);
 * circuit.addGate(StandardGate::H, {circuit.qubit(0)});
 * circuit.measure(circuit.qubit(0), circuit.clbit(0));
 *
 * std::string text = qasm3::dumps(circuit);
 * // OPENQASM 3;
 * // include stdgates.inc;
 * // bit[1] c;
 * // qubit[1] q;
 * // h q[0];
 * // c[0] = measure q[0];
 * @endcode
 *
 * @see ProgramBuilder.hpp for the lowering pipeline
 * @see Printer.hpp for serialization
 */
#pragma once

#include "Ast.hpp"
#include "ExportError.hpp"
#include "Printer.hpp"
#include "ProgramBuilder.hpp"
#include "ir/Circuit.hpp"

#include <ostream>
#include <string>
#include <utility>

namespace qexport::qasm3 {

/**
 * @brief Exports circuits with a fixed configuration.
 *
 * The exporter holds only its options and may be reused for any number of
 * circuits.
 */
class Exporter {
public:
    explicit Exporter(ExporterOptions options = {})
        : options_(std::move(options)) {}

    /**
     * @brief Build the AST for a circuit without serializing it.
     * @throws QASMExportException on unsupported or malformed input
     */
    [[nodiscard]] ast::Program buildProgram(const ir::Circuit& circuit) const {
        ProgramBuilder builder(circuit, options_);
        return builder.build();
    }

    /**
     * @brief Export a circuit to a string.
     * @throws QASMExportException on unsupported or malformed input
     */
    [[nodiscard]] std::string dumps(const ir::Circuit& circuit) const {
        return serialize(buildProgram(circuit));
    }

    /**
     * @brief Export a circuit to a stream.
     * @throws QASMExportException on unsupported or malformed input, in
     *         which case nothing is written to os
     */
    void dump(const ir::Circuit& circuit, std::ostream& os) const {
        const ast::Program program = buildProgram(circuit);
        serialize(program, os);
    }

    [[nodiscard]] const ExporterOptions& options() const noexcept { return options_; }

private:
    ExporterOptions options_;
};

/**
 * @brief Export a circuit to a string with the given options.
 */
[[nodiscard]] inline std::string dumps(const ir::Circuit& circuit,
                                       ExporterOptions options = {}) {
    return Exporter(std::move(options)).dumps(circuit);
}

/**
 * @brief Export a circuit to a stream with the given options.
 */
inline void dump(const ir::Circuit& circuit, std::ostream& os,
                 ExporterOptions options = {}) {
    Exporter(std::move(options)).dump(circuit, os);
}

}  // namespace qexport::qasm3
