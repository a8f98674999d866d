#include "cli/options.hpp"

#include <stdexcept>

namespace gitferry::cli {

Options parse_options(int argc, char **argv, const std::set<std::string> &value_flags,
                      const std::set<std::string> &switch_flags) {
  Options out;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0) {
      out.positional.push_back(arg);
      continue;
    }
    if (switch_flags.count(arg) != 0) {
      out.switches.insert(arg);
    } else if (value_flags.count(arg) != 0) {
      if (i + 1 >= argc)
        throw std::runtime_error(arg + " needs a value");
      out.values[arg] = argv[++i];
    } else {
      throw std::runtime_error("unknown option " + arg);
    }
  }
  return out;
}

} // namespace gitferry::cli
