// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file test_circuit.cpp
 * @brief Unit tests for the Circuit class
 */

#include "ir/Circuit.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace qexport::ir {
namespace {

// =============================================================================
// Construction Tests
// =============================================================================

TEST(CircuitConstructionTest, DefaultHasNoRegisters) {
    Circuit c;
    EXPECT_EQ(c.name(), "circuit");
    EXPECT_EQ(c.numQubits(), 0u);
    EXPECT_EQ(c.numClbits(), 0u);
    EXPECT_TRUE(c.empty());
}

TEST(CircuitConstructionTest, SizedConstructorCreatesQAndC) {
    Circuit c(3, 2, "bell");
    EXPECT_EQ(c.name(), "bell");
    ASSERT_EQ(c.qregs().size(), 1u);
    ASSERT_EQ(c.cregs().size(), 1u);
    EXPECT_EQ(c.qregs()[0].name(), "q");
    EXPECT_EQ(c.cregs()[0].name(), "c");
    EXPECT_EQ(c.numQubits(), 3u);
    EXPECT_EQ(c.numClbits(), 2u);
}

TEST(CircuitConstructionTest, NoClassicalRegisterWhenZeroClbits) {
    Circuit c(2, 0);
    EXPECT_EQ(c.qregs().size(), 1u);
    EXPECT_TRUE(c.cregs().empty());
}

// =============================================================================
// Register Tests
// =============================================================================

TEST(CircuitRegisterTest, RegistersKeepRegistrationOrder) {
    Circuit c;
    c.addRegister(Register::quantum("b", 1));
    c.addRegister(Register::classical("x", 2));
    c.addRegister(Register::quantum("a", 2));

    ASSERT_EQ(c.qregs().size(), 2u);
    EXPECT_EQ(c.qregs()[0].name(), "b");
    EXPECT_EQ(c.qregs()[1].name(), "a");
    EXPECT_EQ(c.numQubits(), 3u);
}

TEST(CircuitRegisterTest, DuplicateNameThrows) {
    Circuit c(1, 1);
    EXPECT_THROW(c.addRegister(Register::quantum("q", 2)), std::invalid_argument);
    EXPECT_THROW(c.addRegister(Register::quantum("c", 2)), std::invalid_argument);
}

TEST(CircuitRegisterTest, FlatBitIndexingSpansRegisters) {
    Circuit c;
    c.addRegister(Register::quantum("a", 2));
    c.addRegister(Register::quantum("b", 1));

    EXPECT_EQ(c.qubit(0), Bit(BitKind::Quantum, "a", 0));
    EXPECT_EQ(c.qubit(2), Bit(BitKind::Quantum, "b", 0));
    EXPECT_THROW((void)c.qubit(3), std::out_of_range);
    EXPECT_THROW((void)c.clbit(0), std::out_of_range);
}

TEST(CircuitRegisterTest, FindRegister) {
    Circuit c(1, 1);
    ASSERT_NE(c.findRegister("c"), nullptr);
    EXPECT_EQ(c.findRegister("c")->kind(), BitKind::Classical);
    EXPECT_EQ(c.findRegister("missing"), nullptr);
}

// =============================================================================
// Append Validation Tests
// =============================================================================

TEST(CircuitAppendTest, AppendsInOrder) {
    Circuit c(2, 2);
    c.addGate(StandardGate::H, {c.qubit(0)});
    c.addGate(StandardGate::CX, {c.qubit(0), c.qubit(1)});
    c.measure(c.qubit(1), c.clbit(1));

    ASSERT_EQ(c.size(), 3u);
    EXPECT_EQ(c.instructions()[0].operation().name(), "h");
    EXPECT_EQ(c.instructions()[1].operation().name(), "cx");
    EXPECT_EQ(c.instructions()[2].operation().kind(), OperationKind::Measurement);
}

TEST(CircuitAppendTest, ThrowsOnWrongQubitCount) {
    Circuit c(2, 0);
    EXPECT_THROW(c.addGate(StandardGate::CX, {c.qubit(0)}), std::invalid_argument);
}

TEST(CircuitAppendTest, ThrowsOnWrongClbitCount) {
    Circuit c(1, 1);
    EXPECT_THROW(c.append(Operation::measure(), {c.qubit(0)}), std::invalid_argument);
}

TEST(CircuitAppendTest, ThrowsOnWrongBitKind) {
    Circuit c(1, 1);
    EXPECT_THROW(c.addGate(StandardGate::H, {c.clbit(0)}), std::invalid_argument);
}

TEST(CircuitAppendTest, ThrowsOnDuplicateQubit) {
    Circuit c(2, 0);
    EXPECT_THROW(c.addGate(StandardGate::CX, {c.qubit(0), c.qubit(0)}),
                 std::invalid_argument);
}

TEST(CircuitAppendTest, ThrowsOnForeignRegister) {
    Circuit c(2, 0);
    auto other = Register::quantum("r", 2);
    EXPECT_THROW(c.addGate(StandardGate::H, {other[0]}), std::out_of_range);
}

TEST(CircuitAppendTest, ThrowsOnIndexBeyondRegister) {
    Circuit c(2, 0);
    EXPECT_THROW(c.addGate(StandardGate::H, {Bit(BitKind::Quantum, "q", 4)}),
                 std::out_of_range);
}

TEST(CircuitAppendTest, AcceptsPhysicalQubits) {
    Circuit c;
    c.addGate(StandardGate::H, {Bit::physicalQubit(0)});
    EXPECT_EQ(c.size(), 1u);
}

TEST(CircuitAppendTest, BarrierOverAllQubits) {
    Circuit c;
    c.addRegister(Register::quantum("a", 2));
    c.addRegister(Register::quantum("b", 1));
    c.barrier();

    ASSERT_EQ(c.size(), 1u);
    const auto& instr = c.instructions()[0];
    EXPECT_EQ(instr.operation().kind(), OperationKind::Barrier);
    EXPECT_EQ(instr.qubits().size(), 3u);
}

// =============================================================================
// Parameter Tests
// =============================================================================

TEST(CircuitParameterTest, SymbolsInFirstUseOrder) {
    Circuit c(2, 0);
    c.addGate(StandardGate::RZ, {c.qubit(0)}, {Symbol("b")});
    c.addGate(StandardGate::RX, {c.qubit(1)}, {0.5});
    c.addGate(StandardGate::RY, {c.qubit(1)}, {Symbol("a")});
    c.addGate(StandardGate::RZ, {c.qubit(1)}, {Symbol("b")});

    auto params = c.parameters();
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params[0].name(), "b");
    EXPECT_EQ(params[1].name(), "a");
}

TEST(CircuitParameterTest, BodySymbolsAreNotCollected) {
    Circuit body(1, 0, "inner");
    body.addGate(StandardGate::RZ, {body.qubit(0)}, {Symbol("theta")});

    Circuit c(1, 0);
    c.append(body.toGate(std::vector<ParameterValue>{0.25}), {c.qubit(0)});
    EXPECT_TRUE(c.parameters().empty());
}

// =============================================================================
// Conversion Tests
// =============================================================================

TEST(CircuitConversionTest, ToGateWrapsCopyOfBody) {
    Circuit body(2, 0, "bell");
    body.addGate(StandardGate::H, {body.qubit(0)});
    body.addGate(StandardGate::CX, {body.qubit(0), body.qubit(1)});

    auto gate = body.toGate();
    EXPECT_EQ(gate->kind(), OperationKind::Gate);
    EXPECT_EQ(gate->name(), "bell");
    EXPECT_EQ(gate->numQubits(), 2u);
    ASSERT_TRUE(gate->hasBody());
    EXPECT_EQ(gate->body()->size(), 2u);

    body.addGate(StandardGate::X, {body.qubit(1)});
    EXPECT_EQ(gate->body()->size(), 2u);
}

TEST(CircuitConversionTest, ToGateDefaultsArgumentsToFormals) {
    Circuit body(1, 0, "rot");
    body.addGate(StandardGate::RZ, {body.qubit(0)}, {Symbol("phi")});

    auto gate = body.toGate();
    ASSERT_EQ(gate->params().size(), 1u);
    EXPECT_EQ(std::get<Symbol>(gate->params()[0]).name(), "phi");
}

TEST(CircuitConversionTest, ToGateThrowsOnArgumentCountMismatch) {
    Circuit body(1, 0, "rot");
    body.addGate(StandardGate::RZ, {body.qubit(0)}, {Symbol("phi")});
    EXPECT_THROW((void)body.toGate(std::vector<ParameterValue>{}), std::invalid_argument);
}

TEST(CircuitConversionTest, ToGateRejectsClassicalBits) {
    Circuit body(1, 1, "measured");
    EXPECT_THROW((void)body.toGate(), std::invalid_argument);
}

TEST(CircuitConversionTest, ToInstructionAllowsClassicalBits) {
    Circuit body(1, 1, "measured");
    body.measure(body.qubit(0), body.clbit(0));

    auto sub = body.toInstruction();
    EXPECT_EQ(sub->kind(), OperationKind::Subroutine);
    EXPECT_EQ(sub->numQubits(), 1u);
    EXPECT_EQ(sub->numClbits(), 1u);
}

TEST(CircuitConversionTest, EachConversionHasItsOwnIdentity) {
    Circuit body(1, 0, "g");
    body.addGate(StandardGate::H, {body.qubit(0)});
    EXPECT_NE(body.toGate()->id(), body.toGate()->id());
}

// =============================================================================
// Utility Tests
// =============================================================================

TEST(CircuitUtilityTest, CloneSharesOperations) {
    Circuit c(1, 0);
    c.addGate(StandardGate::H, {c.qubit(0)});

    Circuit copy = c.clone();
    ASSERT_EQ(copy.size(), 1u);
    EXPECT_EQ(copy.instructions()[0].operation().id(),
              c.instructions()[0].operation().id());
    EXPECT_EQ(copy.qregs(), c.qregs());
}

TEST(CircuitUtilityTest, StreamOutput) {
    Circuit c(2, 0, "demo");
    c.addGate(StandardGate::CX, {c.qubit(0), c.qubit(1)});

    std::ostringstream os;
    os << c;
    EXPECT_EQ(os.str(), "Circuit 'demo' (2 qubits, 0 clbits, 1 instructions):\n"
                        "  cx q[0], q[1]\n");
}

}  // namespace
}  // namespace qexport::ir
