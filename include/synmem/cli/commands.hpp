#pragma once

namespace synmem::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace synmem::cli
