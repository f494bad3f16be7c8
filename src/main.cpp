#include "tracescope/cli/commands.hpp"

int main(int argc, char **argv) { return tracescope::cli::run_cli(argc, argv); }
