// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file main.cpp
 * @brief OpenQASM 3 exporter demonstration
 *
 * Builds a few sample circuits with the qexport::ir library and prints their
 * OpenQASM 3 text. Pass -v to see the exporter's debug log on stderr.
 */

#include "ir/Circuit.hpp"
#include "qasm3/Exporter.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    using namespace qexport;
    using namespace qexport::ir;

    if (argc > 1 && std::string(argv[1]) == "-v") {
        spdlog::set_level(spdlog::level::debug);
    }

    std::cout << "=== OpenQASM 3 Exporter ===\n\n";

    // Bell state with measurement
    std::cout << "Bell state circuit:\n";
    Circuit bell(2, 2, "bell");
    bell.addGate(StandardGate::H, {bell.qubit(0)});
    bell.addGate(StandardGate::CX, {bell.qubit(0), bell.qubit(1)});
    bell.measure(bell.qubit(0), bell.clbit(0));
    bell.measure(bell.qubit(1), bell.clbit(1));

    std::cout << bell << "\n";
    qasm3::dump(bell, std::cout);

    // GHZ preparation wrapped as a custom gate, then used twice
    std::cout << "\nGHZ gate used twice:\n";
    Circuit ghz(3, 0, "ghz");
    ghz.addGate(StandardGate::H, {ghz.qubit(0)});
    ghz.addGate(StandardGate::CX, {ghz.qubit(0), ghz.qubit(1)});
    ghz.addGate(StandardGate::CX, {ghz.qubit(1), ghz.qubit(2)});
    auto ghz_gate = ghz.toGate();

    Circuit twice(3, 0);
    twice.append(ghz_gate, {twice.qubit(0), twice.qubit(1), twice.qubit(2)});
    twice.barrier();
    twice.append(ghz_gate, {twice.qubit(2), twice.qubit(1), twice.qubit(0)});
    qasm3::dump(twice, std::cout);

    // Rotations, an unbound parameter and a conditional correction
    std::cout << "\nParameterized circuit with feedback:\n";
    Circuit feedback(2, 1, "feedback");
    feedback.addGate(StandardGate::RZ, {feedback.qubit(0)}, {constants::PI / 4});
    feedback.addGate(StandardGate::RX, {feedback.qubit(1)}, {Symbol("theta")});
    feedback.addGate(StandardGate::CX, {feedback.qubit(0), feedback.qubit(1)});
    feedback.measure(feedback.qubit(1), feedback.clbit(0));
    feedback.append(Operation::standard(StandardGate::X), {feedback.qubit(0)}, {},
                    Condition(feedback.cregs().front(), 1));
    qasm3::dump(feedback, std::cout);

    std::cout << "\nSame circuit with constant folding disabled:\n";
    qasm3::ExporterOptions options;
    options.fold_constants = false;
    qasm3::dump(feedback, std::cout, options);

    // Unsupported construct
    std::cout << "\nExporting a two-qubit measurement:\n";
    Circuit wide(2, 2);
    wide.append(Operation::measure(2), {wide.qubit(0), wide.qubit(1)},
                {wide.clbit(0), wide.clbit(1)});
    try {
        qasm3::dump(wide, std::cout);
    } catch (const qasm3::QASMExportException& e) {
        std::cout << "  Error: " << e.what() << "\n";
    }

    std::cout << "\nDone.\n";
    return 0;
}
