// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file benchmark_export.cpp
 * @brief Benchmark suite for OpenQASM 3 export
 *
 * Times the export pipeline on standard circuit patterns:
 * - QFT (Quantum Fourier Transform)
 * - Random circuits
 * - QAOA-style circuits
 * - Layered composite gates (deep definition nesting)
 */

#include "ir/Circuit.hpp"
#include "ir/Gate.hpp"
#include "qasm3/Exporter.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace qexport;

// ============================================================================
// Circuit Generators
// ============================================================================

/**
 * @brief Generates a Quantum Fourier Transform circuit.
 *
 * QFT on n qubits requires O(n^2) gates:
 * - n Hadamard gates
 * - n(n-1)/2 controlled phase gates
 */
ir::Circuit generateQFT(std::size_t n) {
    ir::Circuit circuit(n, n, "qft");

    for (std::size_t i = 0; i < n; ++i) {
        circuit.addGate(ir::StandardGate::H, {circuit.qubit(i)});

        for (std::size_t j = i + 1; j < n; ++j) {
            double angle = constants::PI / std::pow(2.0, static_cast<double>(j - i));
            circuit.addGate(ir::StandardGate::CP, {circuit.qubit(j), circuit.qubit(i)}, {angle});
        }
    }
    for (std::size_t i = 0; i < n; ++i) {
        circuit.measure(circuit.qubit(i), circuit.clbit(i));
    }

    return circuit;
}

/**
 * @brief Generates a random circuit with mixed gate types.
 */
ir::Circuit generateRandom(std::size_t n_qubits, std::size_t n_gates, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::size_t> qubit_dist(0, n_qubits - 1);
    std::uniform_int_distribution<int> gate_dist(0, 5);
    std::uniform_real_distribution<double> angle_dist(0.0, 2 * constants::PI);

    ir::Circuit circuit(n_qubits, 0, "random");

    for (std::size_t i = 0; i < n_gates; ++i) {
        int gate_type = gate_dist(rng);
        std::size_t q0 = qubit_dist(rng);
        switch (gate_type) {
            case 0:
                circuit.addGate(ir::StandardGate::H, {circuit.qubit(q0)});
                break;
            case 1:
                circuit.addGate(ir::StandardGate::X, {circuit.qubit(q0)});
                break;
            case 2:
                circuit.addGate(ir::StandardGate::RZ, {circuit.qubit(q0)}, {angle_dist(rng)});
                break;
            case 3:
            case 4:
            case 5: {
                // Two-qubit gate
                std::size_t q1 = qubit_dist(rng);
                if (q1 == q0) {
                    q1 = (q0 + 1) % n_qubits;
                }
                const ir::StandardGate gate = gate_type == 3   ? ir::StandardGate::CX
                                              : gate_type == 4 ? ir::StandardGate::CZ
                                                               : ir::StandardGate::Swap;
                circuit.addGate(gate, {circuit.qubit(q0), circuit.qubit(q1)});
                break;
            }
        }
    }

    return circuit;
}

/**
 * @brief Generates a QAOA-style circuit with symbolic angles.
 *
 * Alternating layers of:
 * - Problem Hamiltonian (ZZ interactions, angle gamma_k)
 * - Mixer Hamiltonian (X rotations, angle beta_k)
 */
ir::Circuit generateQAOA(std::size_t n_qubits, std::size_t p_layers) {
    ir::Circuit circuit(n_qubits, 0, "qaoa");

    // Initial state: |+>^n
    for (std::size_t i = 0; i < n_qubits; ++i) {
        circuit.addGate(ir::StandardGate::H, {circuit.qubit(i)});
    }

    for (std::size_t layer = 0; layer < p_layers; ++layer) {
        ir::Symbol gamma("gamma_" + std::to_string(layer));
        ir::Symbol beta("beta_" + std::to_string(layer));

        // Problem Hamiltonian: ZZ on all edges (ring graph)
        for (std::size_t i = 0; i < n_qubits; ++i) {
            std::size_t j = (i + 1) % n_qubits;
            circuit.addGate(ir::StandardGate::CX, {circuit.qubit(i), circuit.qubit(j)});
            circuit.addGate(ir::StandardGate::RZ, {circuit.qubit(j)}, {gamma});
            circuit.addGate(ir::StandardGate::CX, {circuit.qubit(i), circuit.qubit(j)});
        }

        // Mixer: X rotations
        for (std::size_t i = 0; i < n_qubits; ++i) {
            circuit.addGate(ir::StandardGate::RX, {circuit.qubit(i)}, {beta});
        }
    }

    return circuit;
}

/**
 * @brief Generates a circuit whose gates nest depth levels deep.
 *
 * Level k is a two-qubit gate calling level k-1 twice, so the export
 * produces depth definitions and one top-level call per repetition.
 */
ir::Circuit generateLayered(std::size_t depth, std::size_t repetitions) {
    ir::Circuit base(2, 0, "layer_0");
    base.addGate(ir::StandardGate::H, {base.qubit(0)});
    base.addGate(ir::StandardGate::CX, {base.qubit(0), base.qubit(1)});
    ir::OperationPtr current = base.toGate();

    for (std::size_t level = 1; level < depth; ++level) {
        ir::Circuit next(2, 0, "layer_" + std::to_string(level));
        next.append(current, {next.qubit(0), next.qubit(1)});
        next.append(current, {next.qubit(1), next.qubit(0)});
        current = next.toGate();
    }

    ir::Circuit circuit(2, 0, "layered");
    for (std::size_t i = 0; i < repetitions; ++i) {
        circuit.append(current, {circuit.qubit(0), circuit.qubit(1)});
    }
    return circuit;
}

// ============================================================================
// Benchmarking Infrastructure
// ============================================================================

struct BenchmarkResult {
    std::string name;
    std::size_t n_qubits;
    std::size_t instructions;
    std::size_t output_bytes;
    std::size_t output_lines;
    double export_time_ms;
};

BenchmarkResult runBenchmark(const std::string& name, const ir::Circuit& circuit,
                             int iterations = 10) {
    BenchmarkResult result;
    result.name = name;
    result.n_qubits = circuit.numQubits();
    result.instructions = circuit.size();

    qasm3::Exporter exporter;
    std::string text;

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        text = exporter.dumps(circuit);
    }
    auto end = std::chrono::high_resolution_clock::now();

    result.export_time_ms =
        std::chrono::duration<double, std::milli>(end - start).count() / iterations;
    result.output_bytes = text.size();
    result.output_lines = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));

    return result;
}

void printResults(const std::vector<BenchmarkResult>& results) {
    std::cout << "\n";
    std::cout << "================================================================================\n";
    std::cout << "                          OPENQASM 3 EXPORT BENCHMARKS                          \n";
    std::cout << "================================================================================\n\n";

    std::cout << std::left << std::setw(20) << "Circuit"
              << std::right << std::setw(8) << "Qubits"
              << std::setw(14) << "Instructions"
              << std::setw(10) << "Lines"
              << std::setw(12) << "Bytes"
              << std::setw(14) << "Export (ms)"
              << "\n";

    std::cout << std::string(78, '-') << "\n";

    double total_time = 0;
    for (const auto& r : results) {
        std::cout << std::left << std::setw(20) << r.name
                  << std::right << std::setw(8) << r.n_qubits
                  << std::setw(14) << r.instructions
                  << std::setw(10) << r.output_lines
                  << std::setw(12) << r.output_bytes
                  << std::setw(14) << std::fixed << std::setprecision(3) << r.export_time_ms
                  << "\n";
        total_time += r.export_time_ms;
    }

    std::cout << std::string(78, '-') << "\n";
    std::cout << std::left << std::setw(64) << "TOTAL"
              << std::right << std::setw(14) << std::fixed << std::setprecision(3) << total_time
              << "\n\n";
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "Generating benchmark circuits...\n";

    std::vector<BenchmarkResult> results;

    for (std::size_t n : {4UL, 8UL, 16UL, 32UL}) {
        results.push_back(runBenchmark("QFT-" + std::to_string(n), generateQFT(n)));
    }

    for (auto [n, g] : std::vector<std::pair<std::size_t, std::size_t>>{{10, 100}, {20, 1000}, {50, 10000}}) {
        results.push_back(runBenchmark("Random-" + std::to_string(n) + "x" + std::to_string(g),
                                       generateRandom(n, g)));
    }

    for (auto [n, p] : std::vector<std::pair<std::size_t, std::size_t>>{{10, 2}, {20, 4}}) {
        results.push_back(runBenchmark("QAOA-" + std::to_string(n) + "-p" + std::to_string(p),
                                       generateQAOA(n, p)));
    }

    for (auto [depth, reps] : std::vector<std::pair<std::size_t, std::size_t>>{{4, 10}, {16, 100}}) {
        results.push_back(runBenchmark("Layered-" + std::to_string(depth) + "x" + std::to_string(reps),
                                       generateLayered(depth, reps)));
    }

    printResults(results);

    return 0;
}
