#include "sandcastle/cli/commands.hpp"

int main(int argc, char **argv) { return sandcastle::cli::run_cli(argc, argv); }
