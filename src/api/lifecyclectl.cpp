#include "api/lifecyclectl.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "api/demo_lifecycle.hpp"
#include "api/journal_replay.hpp"
#include "core/lifecycle_queries.hpp"
#include "core/project_state.hpp"
#include "core/transition_table.hpp"
#include "core/transition_validator.hpp"
#include "persist/audit_export.hpp"
#include "persist/audit_journal_reader.hpp"
#include "util/log.hpp"
#include "util/time.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInvalid = 3;
constexpr const char* kProgName = "lifecyclectl";

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--log-level <level>] <command> [args]\n"
              << "Commands:\n"
              << "  table                               Print the transition table\n"
              << "  path                                Print the happy path with terminal/payout marks\n"
              << "  validate <from> <to> <role>         Check a single move (exit 3 when invalid)\n"
              << "  next <state> <role>                 List states reachable in one move\n"
              << "  describe <from> <to>                Print description and approval flag\n"
              << "  replay --input <dir|f1,f2> [opts]   Re-validate a journal (exit 2 on violations)\n"
              << "      --strict --quiet [filters]\n"
              << "  export --input <dir|f1,f2> --format csv|json [filters] [--out <file>]\n"
              << "  filters: --project <id> --user <id> --role <role> --state <state>\n"
              << "           --from-ns <int64> --to-ns <int64>\n"
              << "           (replay verifies every event and reports only matching ones)\n"
              << "  demo [--out-dir <dir>] [--projects <N>] Write a sample journal\n"
              << "Environment: LIFECYCLE_LOG_LEVEL=trace|debug|info|warn|error|fatal\n";
}

std::vector<std::filesystem::path> split_files(const std::string& s) {
    std::vector<std::filesystem::path> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.emplace_back(item);
        }
    }
    return out;
}

// Applies --input to either an explicit file list or a directory.
void assign_input(const std::string& val, std::vector<std::filesystem::path>& files, std::filesystem::path& dir) {
    if (val.find(',') != std::string::npos) {
        files = split_files(val);
        return;
    }
    const std::filesystem::path p(val);
    if (std::filesystem::is_regular_file(p)) {
        files = {p};
    } else {
        dir = p;
    }
}

std::optional<core::ProjectState> state_arg(const std::string& text) {
    const auto s = core::parse_project_state(text);
    if (!s) {
        LOG_ERROR("unknown project state '%s'", text.c_str());
    }
    return s;
}

std::optional<core::Role> role_arg(const std::string& text) {
    const auto r = core::parse_role(text);
    if (!r) {
        LOG_ERROR("unknown role '%s'", text.c_str());
    }
    return r;
}

// The whole argument must be a base-10 integer that fits in int64.
std::optional<std::int64_t> int_arg(const std::string& option, const std::string& text) {
    std::int64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto res = std::from_chars(text.data(), end, value);
    if (res.ec != std::errc() || res.ptr != end) {
        LOG_ERROR("%s expects an integer, got '%s'", option.c_str(), text.c_str());
        return std::nullopt;
    }
    return value;
}

int cmd_table() {
    for (const auto& rule : core::transition_table()) {
        std::cout << core::to_string(rule.from) << " -> " << core::to_string(rule.to)
                  << " | roles: " << rule.allowed_roles.to_string()
                  << " | approval: " << (rule.requires_approval ? "yes" : "no")
                  << " | " << rule.description << "\n";
    }
    return kExitOk;
}

int cmd_path() {
    for (const auto s : core::happy_path()) {
        std::cout << core::to_string(s);
        if (core::is_terminal_state(s)) {
            std::cout << " [terminal]";
        }
        if (core::is_payout_eligible(s)) {
            std::cout << " [payout]";
        }
        std::cout << "\n";
    }
    return kExitOk;
}

int cmd_validate(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return kExitUsage;
    }
    const auto from = state_arg(args[0]);
    const auto to = state_arg(args[1]);
    const auto role = role_arg(args[2]);
    if (!from || !to || !role) {
        return kExitUsage;
    }
    const auto decision = core::validate_transition(*from, *to, *role);
    if (!decision.valid) {
        std::cout << "invalid: " << decision.error.value_or("") << "\n";
        return kExitInvalid;
    }
    if (decision.is_noop()) {
        std::cout << "valid: no-op (already " << core::to_string(*from) << ")\n";
    } else {
        std::cout << "valid: " << decision.rule->description
                  << (decision.rule->requires_approval ? " [requires approval]" : "") << "\n";
    }
    return kExitOk;
}

int cmd_next(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return kExitUsage;
    }
    const auto state = state_arg(args[0]);
    const auto role = role_arg(args[1]);
    if (!state || !role) {
        return kExitUsage;
    }
    for (const auto target : core::valid_next_states(*state, *role).to_vector()) {
        std::cout << core::to_string(target) << "\t" << core::transition_description(*state, target)
                  << (core::requires_approval(*state, target) ? " [requires approval]" : "") << "\n";
    }
    return kExitOk;
}

int cmd_describe(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return kExitUsage;
    }
    const auto from = state_arg(args[0]);
    const auto to = state_arg(args[1]);
    if (!from || !to) {
        return kExitUsage;
    }
    std::cout << core::transition_description(*from, *to) << "\n";
    std::cout << "requires approval: " << (core::requires_approval(*from, *to) ? "yes" : "no") << "\n";
    if (const auto info = core::transition_info(*from, *to)) {
        std::cout << "roles: " << info->allowed_roles.to_string() << "\n";
    } else {
        std::cout << "roles: (no such transition)\n";
    }
    return kExitOk;
}

// Parses the shared journal options. Returns false on a usage error.
bool parse_filter_option(const std::vector<std::string>& args, std::size_t& i, persist::AuditJournalFilter& filter,
                         bool& handled) {
    handled = true;
    const auto& arg = args[i];
    const bool has_value = i + 1 < args.size();
    if (arg == "--project" && has_value) {
        filter.project_id = args[++i];
    } else if (arg == "--user" && has_value) {
        filter.user_id = args[++i];
    } else if (arg == "--role" && has_value) {
        filter.role = role_arg(args[++i]);
        return filter.role.has_value();
    } else if (arg == "--state" && has_value) {
        filter.state = state_arg(args[++i]);
        return filter.state.has_value();
    } else if ((arg == "--from-ns" || arg == "--to-ns") && has_value) {
        const auto ns = int_arg(arg, args[++i]);
        if (!ns) {
            return false;
        }
        (arg == "--from-ns" ? filter.from_time : filter.to_time) = util::from_unix_ns(*ns);
    } else {
        handled = false;
    }
    return true;
}

int cmd_replay(const std::vector<std::string>& args) {
    api::ReplayConfig cfg;
    for (std::size_t i = 0; i < args.size(); ++i) {
        bool handled = false;
        if (!parse_filter_option(args, i, cfg.filter, handled)) {
            return kExitUsage;
        }
        if (handled) {
            continue;
        }
        if (args[i] == "--input" && i + 1 < args.size()) {
            assign_input(args[++i], cfg.input_files, cfg.input_directory);
        } else if (args[i] == "--strict") {
            cfg.require_initial_requested = true;
        } else if (args[i] == "--quiet") {
            cfg.quiet = true;
        } else {
            return kExitUsage;
        }
    }
    if (cfg.input_files.empty() && cfg.input_directory.empty()) {
        return kExitUsage;
    }
    return api::run_replay(cfg);
}

int cmd_export(const std::vector<std::string>& args) {
    persist::AuditJournalReaderOptions opts;
    std::optional<persist::ExportFormat> format;
    std::filesystem::path out_path;
    for (std::size_t i = 0; i < args.size(); ++i) {
        bool handled = false;
        if (!parse_filter_option(args, i, opts.filter, handled)) {
            return kExitUsage;
        }
        if (handled) {
            continue;
        }
        if (args[i] == "--input" && i + 1 < args.size()) {
            assign_input(args[++i], opts.files, opts.directory);
        } else if (args[i] == "--format" && i + 1 < args.size()) {
            format = persist::parse_export_format(args[++i]);
            if (!format) {
                LOG_ERROR("unknown export format '%s'", args[i].c_str());
                return kExitUsage;
            }
        } else if (args[i] == "--out" && i + 1 < args.size()) {
            out_path = args[++i];
        } else {
            return kExitUsage;
        }
    }
    if (!format || (opts.files.empty() && opts.directory.empty())) {
        return kExitUsage;
    }

    persist::AuditJournalReader reader(std::move(opts));
    if (!reader.open()) {
        LOG_ERROR("export: no journal files found");
        return 1;
    }
    const auto events = reader.read_all();
    if (reader.stats().records_corrupt > 0) {
        LOG_WARN("export: skipped %llu corrupt records",
                 static_cast<unsigned long long>(reader.stats().records_corrupt));
    }

    if (out_path.empty()) {
        persist::write_export(std::cout, *format, events);
        return kExitOk;
    }
    std::ofstream out(out_path, std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("export: cannot open %s", out_path.string().c_str());
        return 1;
    }
    persist::write_export(out, *format, events);
    out.flush();
    if (!out) {
        LOG_ERROR("export: write to %s failed", out_path.string().c_str());
        return 1;
    }
    LOG_INFO("export: wrote %zu events to %s", events.size(), out_path.string().c_str());
    return kExitOk;
}

int cmd_demo(const std::vector<std::string>& args) {
    api::DemoConfig cfg;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--out-dir" && i + 1 < args.size()) {
            cfg.output_dir = args[++i];
        } else if (args[i] == "--projects" && i + 1 < args.size()) {
            const auto n = int_arg(args[i], args[i + 1]);
            ++i;
            if (!n || *n <= 0) {
                if (n) {
                    LOG_ERROR("--projects must be positive");
                }
                return kExitUsage;
            }
            cfg.projects = static_cast<std::size_t>(*n);
        } else {
            return kExitUsage;
        }
    }
    api::run_demo(cfg);
    return kExitOk;
}

} // namespace

namespace api {

int run_lifecyclectl_cli(const std::vector<std::string>& argv_tail) {
    std::vector<std::string> args = argv_tail;
    if (args.size() >= 2 && args[0] == "--log-level") {
        const auto lvl = util::parse_log_level(args[1]);
        if (!lvl) {
            print_usage(kProgName);
            return kExitUsage;
        }
        util::set_log_level(*lvl);
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        print_usage(kProgName);
        return kExitUsage;
    }

    const std::string cmd = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    int rc = kExitUsage;
    try {
        if (cmd == "table") {
            rc = cmd_table();
        } else if (cmd == "path") {
            rc = cmd_path();
        } else if (cmd == "validate") {
            rc = cmd_validate(rest);
        } else if (cmd == "next") {
            rc = cmd_next(rest);
        } else if (cmd == "describe") {
            rc = cmd_describe(rest);
        } else if (cmd == "replay") {
            rc = cmd_replay(rest);
        } else if (cmd == "export") {
            rc = cmd_export(rest);
        } else if (cmd == "demo") {
            rc = cmd_demo(rest);
        }
    } catch (const std::exception& ex) {
        LOG_FATAL("%s failed: %s", cmd.c_str(), ex.what());
        return 1;
    }

    if (rc == kExitUsage) {
        print_usage(kProgName);
    }
    return rc;
}

int run_lifecyclectl_main(int argc, char** argv) {
    if (const char* env = std::getenv("LIFECYCLE_LOG_LEVEL")) {
        if (const auto lvl = util::parse_log_level(env)) {
            util::set_log_level(*lvl);
        }
    }
    return run_lifecyclectl_cli(std::vector<std::string>(argv + 1, argv + argc));
}

} // namespace api
