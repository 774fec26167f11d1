#pragma once

#include "ragsync/common/result.hpp"

namespace ragsync::cli {

/// Process exit status for a failed operation: 2 for caller input errors, 3 when nothing
/// matched, 4 when the knowledge source is unreachable, 1 otherwise.
[[nodiscard]] int exit_code_for(common::ErrorCode code);

void print_help();
int run_cli(int argc, char **argv);

} // namespace ragsync::cli
