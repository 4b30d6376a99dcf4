#include "veilguard/cli/commands.hpp"

int main(int argc, char **argv) { return veilguard::cli::run_cli(argc, argv); }
