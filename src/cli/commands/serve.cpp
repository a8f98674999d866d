#include "cli/options.hpp"
#include "gitferry/config.hpp"
#include "gitferry/consts.hpp"
#include "gitferry/net.hpp"
#include "gitferry/receiver.hpp"
#include "gitferry/tcp_remote.hpp"
#include "gitferry/util.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <sys/socket.h>

int cmd_serve(const gitferry::cli::Options &opts) {
  gitferry::Settings settings;
  try {
    settings = gitferry::load_settings(std::filesystem::current_path());
  } catch (const std::exception &e) {
    std::cerr << "serve: " << e.what() << "\n";
    return 2;
  }
  int port = settings.port;
  if (!opts.positional.empty()) {
    const auto p = gitferry::parse_u64(opts.positional[0]);
    if (!p || *p == 0 || *p > 65535) {
      std::cerr << "serve: bad port '" << opts.positional[0] << "'\n";
      return 2;
    }
    port = static_cast<int>(*p);
  }
  if (opts.has("--store"))
    settings.store = opts.values.at("--store");

  gitferry::UploadReceiver receiver{settings.store};
  gitferry::net::UniqueFd listener;
  try {
    std::filesystem::create_directories(settings.store);
    listener = gitferry::net::listen_tcp(port);
  } catch (const std::exception &e) {
    std::cerr << "serve: " << e.what() << "\n";
    return 1;
  }
  std::cout << "gitferry serve listening on port " << port << ", store "
            << settings.store.string() << " (Ctrl+C to stop)\n";
  while (true) {
    gitferry::net::UniqueFd conn{::accept(listener.get(), nullptr, nullptr)};
    if (!conn) {
      perror("accept");
      continue;
    }
    try {
      std::cout << gitferry::tcpremote::serve_connection(conn.get(), receiver) << std::endl;
    } catch (const std::exception &e) {
      std::cerr << "serve: " << e.what() << "\n";
    }
  }
}
