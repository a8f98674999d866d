#include "cli/options.hpp"
#include "gitferry/config.hpp"
#include "gitferry/remote.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_progress(const gitferry::cli::Options &opts) {
  try {
    const std::string agent = opts.positional[0];
    const auto settings = gitferry::load_settings(std::filesystem::current_path());
    const std::string url =
        opts.has("--remote") ? opts.values.at("--remote")
                             : "tcp://" + settings.host + ":" + std::to_string(settings.port);

    const auto received = gitferry::open_remote(url)->query_progress(agent);
    if (!received) {
      std::cout << agent << ": no upload in progress\n";
    } else {
      std::cout << agent << ": " << *received << " chunks received\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "progress: " << e.what() << "\n";
    return 1;
  }
}
