#include "cli/registry.hpp"

#include <iostream>

int main(int argc, char **argv) {
  const auto table = gitferry::cli::command_table();
  return table.dispatch(argc, argv, std::cerr);
}
