#include "domshield/cli/commands.hpp"

int main(int argc, char **argv) { return domshield::cli::run_cli(argc, argv); }
