#include "wardline/cli/commands.hpp"

int main(int argc, char **argv) { return wardline::cli::run_cli(argc, argv); }
