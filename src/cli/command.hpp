#pragma once
#include "cli/options.hpp"

#include <cstddef>
#include <set>
#include <string>

namespace gitferry::cli {

// Handler; `opts` has already been parsed and checked against its Command.
using command_fn = int (*)(const Options &opts);

// One subcommand: its argument contract and handler.
struct Command {
  std::string name;
  std::string args;    // positional synopsis, e.g. "<agent> <bundle> <patch>"
  std::string summary; // one line for the command list
  std::size_t min_args = 0;
  std::size_t max_args = 0;
  std::set<std::string> value_flags;  // "--flag <value>"
  std::set<std::string> switch_flags; // "--flag"
  command_fn fn = nullptr;
};

} // namespace gitferry::cli
