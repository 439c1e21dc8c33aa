#pragma once

namespace beeptunnel::cli {

/// Entry point of the `beeptunnel` executable; returns the process exit status.
int run_cli(int argc, char **argv);

} // namespace beeptunnel::cli
