#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace wardline::cli {

void print_help(std::ostream &out);

/// Runs one command line (without the program name). Text commands read their
/// input from the remaining arguments, or from `in` when none are given or the
/// only argument is "-". Returns the process exit code.
int run_cli(std::vector<std::string> args, std::istream &in, std::ostream &out, std::ostream &err);
int run_cli(int argc, char **argv);

} // namespace wardline::cli
