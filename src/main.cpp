#include "ragsync/cli/commands.hpp"

int main(int argc, char **argv) { return ragsync::cli::run_cli(argc, argv); }
