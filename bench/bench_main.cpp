#include <chrono>
#include <cstddef>
#include <iostream>

#include "core/lifecycle_queries.hpp"
#include "core/project_state.hpp"
#include "core/transition_validator.hpp"

int main() {
    constexpr std::size_t iterations = 100000;
    std::size_t valid = 0;
    std::size_t reachable = 0;

    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        for (const auto from : core::all_project_states) {
            for (const auto role : core::all_roles) {
                reachable += core::valid_next_states(from, role).size();
                for (const auto to : core::all_project_states) {
                    if (core::validate_transition(from, to, role).valid) {
                        ++valid;
                    }
                }
            }
        }
    }
    auto end = std::chrono::steady_clock::now();

    constexpr std::size_t calls_per_iter =
        core::project_state_count * core::role_count * (core::project_state_count + 1);
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Benchmark loop " << iterations << " iterations took " << ns << " ns ("
              << (ns / static_cast<long long>(iterations * calls_per_iter)) << " ns/call)\n";
    std::cout << "valid=" << valid << " reachable=" << reachable << "\n";
    return 0;
}
