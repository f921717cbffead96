// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file test_ast.cpp
 * @brief Unit tests for AST leaf rendering and the Printer
 */

#include "qasm3/Ast.hpp"
#include "qasm3/Printer.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace qexport::qasm3 {
namespace {

ast::IndexedIdentifier indexed(const std::string& name, std::size_t index) {
    return ast::IndexedIdentifier{ast::Identifier{name}, index};
}

ast::IndexedIdentifier flat(const std::string& name) {
    return ast::IndexedIdentifier{ast::Identifier{name}, std::nullopt};
}

ast::Statement gateCall(const std::string& name,
                        std::vector<ast::Expression> params,
                        std::vector<ast::IndexedIdentifier> qubits) {
    return ast::Statement{
        ast::QuantumGateCall{ast::Identifier{name}, std::move(params), std::move(qubits)}};
}

// =============================================================================
// Expression Tests
// =============================================================================

TEST(AstExpressionTest, Identifiers) {
    EXPECT_EQ(ast::toString(ast::Identifier{"theta"}), "theta");
    EXPECT_EQ(ast::toString(indexed("q", 3)), "q[3]");
    EXPECT_EQ(ast::toString(flat("q_3")), "q_3");
}

TEST(AstExpressionTest, Literals) {
    EXPECT_EQ(ast::toString(ast::IntegerLiteral{-2}), "-2");
    EXPECT_EQ(ast::toString(ast::RealLiteral{0.25, true}), "0.25");
    EXPECT_EQ(ast::toString(ast::RealLiteral{constants::PI / 2, true}), "pi/2");
    EXPECT_EQ(ast::toString(ast::RealLiteral{constants::PI / 2, false}),
              "1.5707963267948966");
}

TEST(AstExpressionTest, Comparison) {
    ast::ComparisonExpression cond{ast::Identifier{"cr"}, ast::IntegerLiteral{2}};
    EXPECT_EQ(ast::toString(cond), "cr == 2");

    ast::ComparisonExpression bit_cond{indexed("cr", 1), ast::IntegerLiteral{1}};
    EXPECT_EQ(ast::toString(bit_cond), "cr[1] == 1");
}

// =============================================================================
// Leaf Statement Tests
// =============================================================================

TEST(AstStatementTest, HeaderLines) {
    EXPECT_EQ(ast::toString(ast::Version{}), "OPENQASM 3;");
    EXPECT_EQ(ast::toString(ast::Include{"stdgates.inc"}), "include stdgates.inc;");
}

TEST(AstStatementTest, Declarations) {
    ast::RegisterDeclaration bits{ast::DeclarationKind::Bit, {"c"}, {2}};
    ast::RegisterDeclaration qubits{ast::DeclarationKind::Qubit, {"q"}, {5}};
    EXPECT_EQ(ast::toString(bits), "bit[2] c;");
    EXPECT_EQ(ast::toString(qubits), "qubit[5] q;");
    EXPECT_EQ(ast::toString(ast::InputDeclaration{{"theta"}}), "input float[32] theta;");
}

TEST(AstStatementTest, GateCallOmitsEmptyParentheses) {
    ast::QuantumGateCall h{{"h"}, {}, {indexed("q", 0)}};
    EXPECT_EQ(ast::toString(h), "h q[0];");

    ast::QuantumGateCall u{{"U"},
                           {ast::RealLiteral{2 * constants::PI, true},
                            ast::RealLiteral{0.5, true},
                            ast::Identifier{"phi"}},
                           {indexed("q", 1)}};
    EXPECT_EQ(ast::toString(u), "U(2*pi, 0.5, phi) q[1];");
}

TEST(AstStatementTest, BarrierAndMeasurement) {
    ast::QuantumBarrier barrier{{indexed("q", 0), indexed("q", 2)}};
    EXPECT_EQ(ast::toString(barrier), "barrier q[0], q[2];");

    ast::QuantumMeasurementAssignment measure{
        indexed("c", 0), ast::QuantumMeasurement{{indexed("q", 1)}}};
    EXPECT_EQ(ast::toString(measure), "c[0] = measure q[1];");
}

TEST(AstStatementTest, Signatures) {
    ast::QuantumGateSignature gate{{"rot"}, {{"a"}, {"b"}}, {{"q_0"}, {"q_1"}}};
    EXPECT_EQ(ast::toString(gate), "gate rot(a, b) q_0, q_1");

    ast::SubroutineDefinition sub;
    sub.name = {"sub"};
    sub.qubits.push_back({{"q_0"}, std::nullopt});
    sub.qubits.push_back({{"r"}, ast::Designator{2}});
    EXPECT_EQ(ast::signatureText(sub), "def sub qubit q_0, qubit[2] r");

    sub.params.push_back({"theta"});
    EXPECT_EQ(ast::signatureText(sub), "def sub(float[32] theta) qubit q_0, qubit[2] r");

    ast::OpaqueDefinition opaque{{{"pulse"}, {{"param_0"}}, {{"q_0"}}}};
    EXPECT_EQ(ast::toString(opaque), "opaque pulse(param_0) q_0;");
}

// =============================================================================
// Printer Tests
// =============================================================================

TEST(PrinterTest, GateDefinitionBlock) {
    ast::Program program;
    program.header.includes.push_back({"stdgates.inc"});

    ast::QuantumGateDefinition def;
    def.signature = {{"bell"}, {}, {{"q_0"}, {"q_1"}}};
    def.body.push_back(gateCall("h", {}, {flat("q_0")}));
    def.body.push_back(gateCall("cx", {}, {flat("q_0"), flat("q_1")}));
    program.statements.push_back(std::move(def));
    program.statements.push_back(ast::RegisterDeclaration{ast::DeclarationKind::Qubit, {"q"}, {2}});
    program.statements.push_back(gateCall("bell", {}, {indexed("q", 0), indexed("q", 1)}));

    EXPECT_EQ(serialize(program),
              "OPENQASM 3;\n"
              "include stdgates.inc;\n"
              "gate bell q_0, q_1 {\n"
              "h q_0;\n"
              "cx q_0, q_1;\n"
              "}\n"
              "qubit[2] q;\n"
              "bell q[0], q[1];\n");
}

TEST(PrinterTest, SubroutineBlockEndsWithReturn) {
    ast::Program program;
    ast::SubroutineDefinition sub;
    sub.name = {"sub"};
    sub.qubits.push_back({{"q_0"}, std::nullopt});
    sub.body.push_back(gateCall("x", {}, {flat("q_0")}));
    program.statements.push_back(std::move(sub));

    EXPECT_EQ(serialize(program),
              "OPENQASM 3;\n"
              "def sub qubit q_0 {\n"
              "x q_0;\n"
              "return;\n"
              "}\n");
}

TEST(PrinterTest, NestedBranches) {
    ast::BranchingStatement inner{
        ast::ComparisonExpression{indexed("c", 1), ast::IntegerLiteral{1}}, {}};
    inner.true_block.statements.push_back(gateCall("x", {}, {indexed("q", 0)}));

    ast::BranchingStatement outer{
        ast::ComparisonExpression{ast::Identifier{"c"}, ast::IntegerLiteral{3}}, {}};
    outer.true_block.statements.push_back(gateCall("h", {}, {indexed("q", 0)}));
    outer.true_block.statements.push_back(ast::Statement{std::move(inner)});

    ast::Program program;
    program.statements.push_back(ast::Statement{std::move(outer)});

    EXPECT_EQ(serialize(program),
              "OPENQASM 3;\n"
              "if (c == 3){\n"
              "h q[0];\n"
              "if (c[1] == 1){\n"
              "x q[0];\n"
              "}\n"
              "}\n");
}

TEST(PrinterTest, StreamAndStringOutputAgree) {
    ast::Program program;
    program.header.includes.push_back({"stdgates.inc"});
    program.statements.push_back(ast::InputDeclaration{{"theta"}});
    program.statements.push_back(ast::RegisterDeclaration{ast::DeclarationKind::Qubit, {"q"}, {1}});
    program.statements.push_back(
        gateCall("rz", {ast::Identifier{"theta"}}, {indexed("q", 0)}));

    std::ostringstream os;
    serialize(program, os);
    EXPECT_EQ(os.str(), serialize(program));
    EXPECT_EQ(os.str(),
              "OPENQASM 3;\n"
              "include stdgates.inc;\n"
              "input float[32] theta;\n"
              "qubit[1] q;\n"
              "rz(theta) q[0];\n");
}

}  // namespace
}  // namespace qexport::qasm3
