#include "cli/registry.hpp"

#include <sstream>
#include <stdexcept>

namespace gitferry::cli {

void CommandTable::add(Command cmd) {
  const std::string name = cmd.name;
  commands_.insert_or_assign(name, std::move(cmd));
}

const Command *CommandTable::find(std::string_view name) const {
  const auto it = commands_.find(name);
  return it == commands_.end() ? nullptr : &it->second;
}

std::string CommandTable::usage(const Command &cmd) {
  std::ostringstream os;
  os << "usage: gitferry " << cmd.name;
  if (!cmd.args.empty())
    os << ' ' << cmd.args;
  for (const auto &flag : cmd.value_flags)
    os << " [" << flag << " <" << flag.substr(2) << ">]";
  for (const auto &flag : cmd.switch_flags)
    os << " [" << flag << "]";
  return os.str();
}

void CommandTable::print_help(std::ostream &os) const {
  os << "usage: gitferry <command> [args]\n\n";
  os << "commands:\n";
  for (const auto &[name, cmd] : commands_) {
    os << "  " << name << "  " << cmd.summary << "\n";
  }
}

int CommandTable::dispatch(int argc, char **argv, std::ostream &err) const {
  if (argc < 2) {
    print_help(err);
    return 2;
  }
  const std::string_view name = argv[1];
  const Command *cmd = find(name);
  if (cmd == nullptr) {
    err << "unknown command: " << name << "\n";
    print_help(err);
    return 2;
  }

  // argv[1..] with the command name in the argv[0] slot
  Options opts;
  try {
    opts = parse_options(argc - 1, argv + 1, cmd->value_flags, cmd->switch_flags);
  } catch (const std::runtime_error &e) {
    err << cmd->name << ": " << e.what() << "\n" << usage(*cmd) << "\n";
    return 2;
  }
  if (opts.positional.size() < cmd->min_args || opts.positional.size() > cmd->max_args) {
    err << usage(*cmd) << "\n";
    return 2;
  }
  return cmd->fn(opts);
}

} // namespace gitferry::cli
