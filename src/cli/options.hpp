#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>

namespace gitferry::cli {

struct Options {
  std::vector<std::string> positional;
  std::map<std::string, std::string> values; // "--flag value"
  std::set<std::string> switches;            // "--flag"

  [[nodiscard]] bool has(const std::string& flag) const {
    return values.count(flag) != 0 || switches.count(flag) != 0;
  }
};

// Split argv[1..] into positionals and the given flags. Throws std::runtime_error on
// an unknown flag or a value flag without a value.
Options parse_options(int argc, char** argv, const std::set<std::string>& value_flags,
                      const std::set<std::string>& switch_flags = {});

} // namespace gitferry::cli
