#pragma once

#include <string>
#include <vector>

namespace api {

// Exit codes: 0 ok, 1 usage or I/O error, 2 replay found violations,
// 3 validate judged the move invalid.

// Run using argv-style inputs. Honors LIFECYCLE_LOG_LEVEL.
int run_lifecyclectl_main(int argc, char** argv);

// Arguments after the program name. For tests and programmatic callers.
int run_lifecyclectl_cli(const std::vector<std::string>& args);

} // namespace api
