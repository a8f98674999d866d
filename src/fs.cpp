#include "gitferry/fs.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace gitferry::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (!p.has_parent_path())
    return;
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp, ec);
      throw std::runtime_error("atomic replace failed: " + p.string());
    }
  }
}

std::vector<std::uint8_t> read_range(const std::filesystem::path &p, std::uint64_t offset,
                                     std::size_t length) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  std::vector<std::uint8_t> buf(length);
  if (length == 0)
    return buf;
  ifs.seekg(static_cast<std::streamoff>(offset));
  if (!ifs) {
    throw std::runtime_error("seek failed: " + p.string());
  }
  ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(length));
  if (ifs.bad()) {
    throw std::runtime_error("read failed: " + p.string());
  }
  buf.resize(static_cast<std::size_t>(ifs.gcount()));
  return buf;
}

bool remove_file(const std::filesystem::path &p) {
  std::error_code ec;
  const bool removed = std::filesystem::remove(p, ec);
  if (ec)
    throw std::runtime_error("remove failed: " + p.string() + ": " + ec.message());
  return removed;
}

} // namespace gitferry::fs
