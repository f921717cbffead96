// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the OpenQASM 3 exporter
 *
 * Demonstrates:
 * - Creating circuits with registers, standard gates and measurements
 * - Exporting to a string and to a stream
 * - Composite gates and subroutines
 * - Toggling pi constant folding
 * - Handling export errors
 */

#include "ir/Circuit.hpp"
#include "ir/Gate.hpp"
#include "qasm3/Exporter.hpp"

#include <fstream>
#include <iostream>
#include <string>

using namespace qexport;

int main() {
    std::cout << "=== OpenQASM 3 Exporter - Basic Usage ===\n\n";

    // =========================================================================
    // 1. Exporting a circuit to a string
    // =========================================================================
    std::cout << "1. Exporting a Bell state circuit to a string:\n";

    ir::Circuit bell(2, 2, "bell");
    bell.addGate(ir::StandardGate::H, {bell.qubit(0)});
    bell.addGate(ir::StandardGate::CX, {bell.qubit(0), bell.qubit(1)});
    bell.measure(bell.qubit(0), bell.clbit(0));
    bell.measure(bell.qubit(1), bell.clbit(1));

    const std::string text = qasm3::dumps(bell);
    std::cout << text << "\n";

    // =========================================================================
    // 2. Registers and composite operations
    // =========================================================================
    std::cout << "2. Custom registers, a composite gate and a subroutine:\n";

    ir::Circuit swap_body(2, 0, "my_swap");
    swap_body.addGate(ir::StandardGate::CX, {swap_body.qubit(0), swap_body.qubit(1)});
    swap_body.addGate(ir::StandardGate::CX, {swap_body.qubit(1), swap_body.qubit(0)});
    swap_body.addGate(ir::StandardGate::CX, {swap_body.qubit(0), swap_body.qubit(1)});
    auto my_swap = swap_body.toGate();

    ir::Circuit reset_body(1, 1, "measure_reset");
    reset_body.measure(reset_body.qubit(0), reset_body.clbit(0));
    reset_body.append(ir::Operation::standard(ir::StandardGate::X), {reset_body.qubit(0)},
                      {}, ir::Condition(reset_body.clbit(0), 1));
    auto measure_reset = reset_body.toInstruction();

    const auto data = ir::Register::quantum("data", 2);
    const auto flags = ir::Register::classical("flags", 2);
    ir::Circuit program("registers");
    program.addRegister(data);
    program.addRegister(flags);
    program.append(my_swap, {data[0], data[1]});
    program.append(measure_reset, {data[0]}, {flags[0]});
    program.append(measure_reset, {data[1]}, {flags[1]});

    qasm3::dump(program, std::cout);
    std::cout << "\n";

    // =========================================================================
    // 3. Constant folding
    // =========================================================================
    std::cout << "3. Pi folding on and off:\n";

    ir::Circuit rotations(1, 0, "rotations");
    rotations.addGate(ir::StandardGate::RZ, {rotations.qubit(0)}, {constants::PI / 2});
    rotations.addGate(ir::StandardGate::U, {rotations.qubit(0)},
                      {2 * constants::PI, 3 * constants::PI / 4, 0.1});

    qasm3::ExporterOptions decimal;
    decimal.fold_constants = false;

    std::cout << "   folded:\n" << qasm3::Exporter().dumps(rotations);
    std::cout << "   decimal:\n" << qasm3::Exporter(decimal).dumps(rotations) << "\n";

    // =========================================================================
    // 4. Writing to a file
    // =========================================================================
    std::cout << "4. Writing to bell.qasm:\n";
    {
        std::ofstream out("bell.qasm");
        qasm3::dump(bell, out);
    }
    std::cout << "   wrote " << text.size() << " bytes\n\n";

    // =========================================================================
    // 5. Export errors
    // =========================================================================
    std::cout << "5. Conditions other than equality cannot be exported:\n";

    ir::Circuit guarded(1, 1, "guarded");
    guarded.append(ir::Operation::standard(ir::StandardGate::X), {guarded.qubit(0)}, {},
                   ir::Condition(guarded.cregs().front(), 0, ir::ComparisonOp::Greater));
    try {
        std::cout << qasm3::dumps(guarded);
    } catch (const qasm3::QASMExportException& e) {
        std::cout << "   " << e.error() << "\n";
    }

    std::cout << "\n=== Done! ===\n";

    return 0;
}
