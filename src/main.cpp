#include "distill/cli/commands.hpp"

int main(int argc, char **argv) { return distill::cli::run_cli(argc, argv); }
