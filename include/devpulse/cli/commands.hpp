#pragma once

namespace devpulse::cli {

void print_help();

/// Entry point for the devpulse binary. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace devpulse::cli
