#include "synmem/cli/commands.hpp"

int main(int argc, char **argv) { return synmem::cli::run_cli(argc, argv); }
