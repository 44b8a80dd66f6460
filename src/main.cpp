#include "almanac/cli/commands.hpp"

int main(int argc, char **argv) { return almanac::cli::run_cli(argc, argv); }
