#include "beeptunnel/cli/commands.hpp"

int main(int argc, char **argv) { return beeptunnel::cli::run_cli(argc, argv); }
