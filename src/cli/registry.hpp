#pragma once
#include "cli/command.hpp"

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <string_view>

namespace gitferry::cli {

class CommandTable {
public:
  // Replaces an existing command of the same name.
  void add(Command cmd);
  [[nodiscard]] const Command *find(std::string_view name) const;

  // "usage: gitferry <name> <args> [--flag <flag>] [--switch]"
  [[nodiscard]] static std::string usage(const Command &cmd);
  void print_help(std::ostream &os) const;

  // argv[1] names the command. Parses the rest against the command's flags and
  // positional count, then runs it. Usage errors go to `err` and return 2.
  int dispatch(int argc, char **argv, std::ostream &err) const;

private:
  std::map<std::string, Command, std::less<>> commands_;
};

// All gitferry subcommands (register_commands.cpp)
CommandTable command_table();

} // namespace gitferry::cli
