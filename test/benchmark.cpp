// Standalone benchmark for mine tick performance
// Build target: benchmark (see CMakeLists.txt)

#include <iostream>
#include <chrono>
#include <random>
#include <string>
#include <vector>
#include "mine_game.h"

struct BenchmarkResult {
    std::string name;
    size_t cells;
    int iterations;
    double total_ms;
    double per_tick_us;
    double ticks_per_sec;
};

BenchmarkResult run_benchmark(const std::string& name, const Level& level, int iterations) {
    auto shared = std::make_shared<const Level>(level);

    // Warmup
    WorldState warmup = initialize(shared);
    for (int i = 0; i < 5 && !warmup.verdict.terminal(); i++) {
        warmup = step(warmup, Action::Wait).state;
    }

    // Actual benchmark. A finished level is restarted so every iteration
    // simulates a full tick.
    WorldState state = initialize(shared);
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        if (state.verdict.terminal()) {
            state = initialize(shared);
        }
        state = step(state, Action::Wait).state;
    }
    auto end = std::chrono::high_resolution_clock::now();

    double total_ms = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count() / 1000.0;
    double per_tick_us = (total_ms * 1000.0) / iterations;
    double ticks_per_sec = iterations / (total_ms / 1000.0);

    size_t cells = static_cast<size_t>(level.grid.width()) * static_cast<size_t>(level.grid.height());
    return {name, cells, iterations, total_ms, per_tick_us, ticks_per_sec};
}

void print_result(const BenchmarkResult& r) {
    std::cout << "  " << r.name << ":\n";
    std::cout << "    Cells: " << r.cells << ", Iterations: " << r.iterations << "\n";
    std::cout << "    Total: " << r.total_ms << " ms\n";
    std::cout << "    Per tick: " << r.per_tick_us << " µs\n";
    std::cout << "    Speed: " << static_cast<int>(r.ticks_per_sec) << " ticks/sec\n";
    std::cout << "\n";
}

// Walled mine of the given size with randomly scattered earth, rocks,
// lambdas and beards. The robot sits in the bottom-left corner under a
// wall so falling rocks cannot end the run early.
Level generate_random_mine(int size, unsigned seed, double rock_density, double beard_density) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    std::string text;
    for (int row = 0; row < size; row++) {
        std::string line(static_cast<size_t>(size), ' ');
        for (int col = 0; col < size; col++) {
            char& c = line[static_cast<size_t>(col)];
            if (row == 0 || row == size - 1 || col == 0 || col == size - 1) {
                c = '#';
                continue;
            }
            double roll = dist(rng);
            if (roll < rock_density) {
                c = roll < rock_density / 4 ? '@' : '*';
            } else if (roll < rock_density + beard_density) {
                c = 'W';
            } else if (roll < rock_density + beard_density + 0.05) {
                c = '\\';
            } else if (roll < 0.7) {
                c = '.';
            }
        }
        text += line;
        text += "\n";
    }

    // Robot at (2, 2) under a wall, lift at the right edge.
    std::string::size_type robot_row = static_cast<size_t>(size - 2) * static_cast<size_t>(size + 1);
    std::string::size_type shelf_row = static_cast<size_t>(size - 3) * static_cast<size_t>(size + 1);
    text[robot_row + 1] = 'R';
    text[robot_row + 2] = '.';
    text[shelf_row + 1] = '#';
    text[robot_row + static_cast<size_t>(size - 1)] = 'L';

    text += "\nGrowth 5\nFlooding 0\n";
    return Level::parse(text, "random_" + std::to_string(size) + ".map");
}

int main() {
    std::cout << "=== Mine Tick Performance Benchmark ===\n\n";

    std::vector<BenchmarkResult> results;

    std::cout << "Benchmark 1: Small mine (32x32, rocks only)\n";
    auto small = generate_random_mine(32, 42, 0.2, 0.0);
    auto r1 = run_benchmark("Small mine", small, 10000);
    print_result(r1);
    results.push_back(r1);

    std::cout << "Benchmark 2: Medium mine (128x128, rocks and beards)\n";
    auto medium = generate_random_mine(128, 42, 0.2, 0.02);
    auto r2 = run_benchmark("Medium mine", medium, 1000);
    print_result(r2);
    results.push_back(r2);

    std::cout << "Benchmark 3: Large mine (512x512, rocks and beards)\n";
    auto large = generate_random_mine(512, 42, 0.2, 0.02);
    auto r3 = run_benchmark("Large mine", large, 100);
    print_result(r3);
    results.push_back(r3);

    std::cout << "Benchmark 4: Dense rockfall (256x256, 50% rocks)\n";
    auto dense = generate_random_mine(256, 7, 0.5, 0.0);
    auto r4 = run_benchmark("Dense rockfall", dense, 200);
    print_result(r4);
    results.push_back(r4);

    // Summary
    std::cout << "=== Summary ===\n";
    for (const auto& r : results) {
        std::cout << "  " << r.name << ": " << r.per_tick_us << " µs/tick\n";
    }

    return 0;
}
