#pragma once

#include <cstddef>
#include <filesystem>

#include "core/project_registry.hpp"

namespace api {

struct DemoConfig {
    std::filesystem::path output_dir{"demo_journal"};
    std::size_t projects{3};
};

struct DemoSummary {
    std::size_t projects{0};
    core::RegistryCounters counters{};
    std::filesystem::path journal_file{};
};

// Drives `projects` projects through the lifecycle against a journaled
// registry, cycling three scripts by project index: a clean run, a run with
// QA and customer retakes, and a cancellation preceded by one unauthorized
// request.
// Throws std::runtime_error if the journal refuses an event.
DemoSummary run_demo(const DemoConfig& cfg);

} // namespace api
