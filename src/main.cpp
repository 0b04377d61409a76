#include "sessionrelay/cli/commands.hpp"

int main(int argc, char **argv) { return sessionrelay::cli::run_cli(argc, argv); }
