// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Printer.hpp
 * @brief Serializes an OpenQASM 3 AST to text
 *
 * The printer is a depth-first fold over the AST. Leaf nodes contribute
 * their canonical text (see Ast.hpp) as one line each; composite nodes
 * (program, header, definitions, blocks, branches) emit their opening line,
 * their children in order, and their closing line. Nothing is reordered.
 *
 * @see Ast.hpp for node definitions
 */

#pragma once

#include "Ast.hpp"

#include <ostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace qexport::qasm3 {

/**
 * @brief Writes an AST to an output stream, one line per leaf node.
 *
 * Example:
 * @code
 * Printer printer(std::cout);
 * printer.print(program);
 * @endcode
 */
class Printer {
public:
    /**
     * @brief Construct a printer writing to the given stream.
     * @param os Destination stream; must outlive the printer
     */
    explicit Printer(std::ostream& os) : os_(os) {}

    /**
     * @brief Write a complete program.
     */
    void print(const ast::Program& program) {
        print(program.header);
        for (const auto& statement : program.statements) {
            std::visit([this](const auto& node) { print(node); }, statement);
        }
    }

    void print(const ast::Header& header) {
        line(ast::toString(header.version));
        for (const auto& include : header.includes) {
            line(ast::toString(include));
        }
    }

    void print(const ast::QuantumGateDefinition& node) {
        line(ast::toString(node.signature) + " {");
        print(node.body);
        line("}");
    }

    void print(const ast::SubroutineDefinition& node) {
        line(ast::signatureText(node) + " {");
        print(node.body);
        line("return;");
        line("}");
    }

    void print(const ast::OpaqueDefinition& node) {
        line(ast::toString(node));
    }

    void print(const ast::RegisterDeclaration& node) {
        line(ast::toString(node));
    }

    void print(const ast::InputDeclaration& node) {
        line(ast::toString(node));
    }

    void print(const ast::Statement& statement) {
        std::visit([this](const auto& node) { print(node); }, statement.node);
    }

    void print(const ast::QuantumGateCall& node) { line(ast::toString(node)); }
    void print(const ast::SubroutineCall& node) { line(ast::toString(node)); }
    void print(const ast::QuantumBarrier& node) { line(ast::toString(node)); }

    void print(const ast::QuantumMeasurementAssignment& node) {
        line(ast::toString(node));
    }

    void print(const ast::BranchingStatement& node) {
        line("if (" + ast::toString(node.condition) + "){");
        print(node.true_block.statements);
        line("}");
    }

    void print(const std::vector<ast::Statement>& statements) {
        for (const auto& statement : statements) {
            print(statement);
        }
    }

private:
    std::ostream& os_;

    void line(const std::string& text) {
        os_ << text << '\n';
    }
};

/**
 * @brief Serialize a program to a string.
 */
[[nodiscard]] inline std::string serialize(const ast::Program& program) {
    std::ostringstream out;
    Printer(out).print(program);
    return out.str();
}

/**
 * @brief Serialize a program directly to a stream.
 */
inline void serialize(const ast::Program& program, std::ostream& os) {
    Printer(os).print(program);
}

}  // namespace qexport::qasm3
