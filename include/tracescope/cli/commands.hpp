#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace tracescope::cli {

/// Entry point for the `tracescope` executable.
int run_cli(int argc, char **argv);

/// Runs one command. `args` excludes the program name.
int run_cli(std::vector<std::string> args, std::ostream &out, std::ostream &err);

} // namespace tracescope::cli
