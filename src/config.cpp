#include "gitferry/config.hpp"

#include "gitferry/consts.hpp"
#include "gitferry/fs.hpp"
#include "gitferry/util.hpp"

#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

std::uint64_t parse_number(std::string_view key, const std::string &value) {
  const auto n = gitferry::parse_u64(value);
  if (!n) {
    throw std::runtime_error("config: " + std::string(key) + " is not a number: '" + value + "'");
  }
  return *n;
}

} // namespace

namespace gitferry {

Settings default_settings(const std::filesystem::path &dir) {
  return Settings{.host = std::string(consts::kDefaultHost),
                  .port = consts::portNumber,
                  .chunk_size = consts::kDefaultChunkSize,
                  .store = dir / consts::kStateDir / consts::kUploadsDir};
}

std::uint64_t parse_chunk_size(std::string_view text) {
  const auto n = parse_u64(text);
  if (!n || *n == 0)
    throw std::runtime_error("chunk size must be a positive number: '" + std::string(text) + "'");
  if (*n > consts::kMaxChunkBytes)
    throw std::runtime_error("chunk size " + std::to_string(*n) + " exceeds the " +
                             format_bytes(consts::kMaxChunkBytes) + " receiver limit");
  return *n;
}

std::filesystem::path settings_path(const std::filesystem::path &dir) {
  return dir / consts::kStateDir / consts::kConfigFile;
}

auto load_settings(const std::filesystem::path &dir) -> Settings {
  Settings out = default_settings(dir);
  const auto path = settings_path(dir);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  constexpr std::string_view k_host = "host:";
  constexpr std::string_view k_port = "port:";
  constexpr std::string_view k_chunk = "chunk_size:";
  constexpr std::string_view k_store = "store:";

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_host)) {
      out.host = strutil::trim(sv.substr(k_host.size()));
    } else if (sv.starts_with(k_port)) {
      const auto port = parse_number("port", strutil::trim(sv.substr(k_port.size())));
      if (port == 0 || port > 65535)
        throw std::runtime_error("config: port out of range");
      out.port = static_cast<int>(port);
    } else if (sv.starts_with(k_chunk)) {
      out.chunk_size = parse_chunk_size(strutil::trim(sv.substr(k_chunk.size())));
    } else if (sv.starts_with(k_store)) {
      std::filesystem::path store = strutil::trim(sv.substr(k_store.size()));
      out.store = store.is_relative() ? dir / store : store;
    }
  }
  return out;
}

void save_settings(const std::filesystem::path &dir, const Settings &settings) {
  std::ostringstream os;
  os << "host: " << settings.host << '\n'
     << "port: " << settings.port << '\n'
     << "chunk_size: " << settings.chunk_size << '\n'
     << "store: " << settings.store.string() << '\n';

  const std::string s = os.str();
  fs::write_file_atomic(settings_path(dir), fs::as_bytes(s));
}

} // namespace gitferry
