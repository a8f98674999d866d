#include "gitferry/chunker.hpp"
#include "gitferry/envelope.hpp"
#include "gitferry/errors.hpp"
#include "gitferry/region_reader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <random>
#include <stdexcept>
#include <string>
#include <variant>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string render(const gitferry::Envelope &env) {
  const gitferry::AlignedRegionReader reader;
  const gitferry::ChunkGenerator gen(env, reader, env.total_length() + 1);
  return gen.chunk(0);
}

int main() {
  const fs::path dir =
      fs::temp_directory_path() / ("gitferry_envelope_" + std::to_string(std::random_device{}()));
  try {
    write_file(dir / "a.bundle", "ABC");
    write_file(dir / "b.patch", "XY");
    write_file(dir / "empty.patch", "");

    // Concrete layout
    const gitferry::Envelope env{gitferry::describe_source(dir / "a.bundle"),
                                 gitferry::describe_source(dir / "b.patch"),
                                 gitferry::EnvelopeMetadata{}};
    const std::string expected =
        R"({"bundleBase64":"QUJD","patchBase64":"WFk=","isIncremental":false})";
    const std::string full = render(env);
    if (full != expected) {
      std::cerr << "envelope mismatch:\n  got      " << full << "\n  expected " << expected
                << "\n";
      return 1;
    }
    if (env.total_length() != expected.size()) {
      std::cerr << "total_length " << env.total_length() << " != " << expected.size() << "\n";
      return 1;
    }
    const auto doc = nlohmann::json::parse(full);
    if (doc.at("bundleBase64") != "QUJD" || doc.at("patchBase64") != "WFk=" ||
        doc.at("isIncremental") != false) {
      std::cerr << "parsed fields wrong\n";
      return 1;
    }

    // Range inside the prefix: one literal slice, no binary request
    {
      const auto slices = env.resolve(2, 10);
      if (slices.size() != 1 || !std::holds_alternative<gitferry::LiteralSlice>(slices[0]) ||
          std::get<gitferry::LiteralSlice>(slices[0]).text != expected.substr(2, 8)) {
        std::cerr << "prefix-only range resolved wrong\n";
        return 1;
      }
    }

    // Range straddling prefix tail, bundle, middle and patch head
    {
      const auto slices = env.resolve(10, 40);
      if (slices.size() != 4) {
        std::cerr << "straddling range: expected 4 slices, got " << slices.size() << "\n";
        return 1;
      }
      const auto *bundle = std::get_if<gitferry::BinarySlice>(&slices[1]);
      const auto *patch = std::get_if<gitferry::BinarySlice>(&slices[3]);
      if (!bundle || bundle->start != 0 || bundle->end != 4 || !patch || patch->start != 0 ||
          patch->end != 2 || !std::holds_alternative<gitferry::LiteralSlice>(slices[2])) {
        std::cerr << "straddling range: wrong slice layout\n";
        return 1;
      }
    }

    // Whole document touches all five segments
    if (env.resolve(0, env.total_length()).size() != 5) {
      std::cerr << "whole range should give 5 slices\n";
      return 1;
    }
    if (!env.resolve(7, 7).empty()) {
      std::cerr << "empty range should give no slices\n";
      return 1;
    }

    // Zero-length patch: middle and suffix become adjacent, no patch slice
    {
      const gitferry::Envelope e2{gitferry::describe_source(dir / "a.bundle"),
                                  gitferry::describe_source(dir / "empty.patch"),
                                  gitferry::EnvelopeMetadata{}};
      const auto slices = e2.resolve(0, e2.total_length());
      int binaries = 0;
      for (const auto &s : slices)
        binaries += std::holds_alternative<gitferry::BinarySlice>(s) ? 1 : 0;
      if (slices.size() != 4 || binaries != 1) {
        std::cerr << "empty patch: expected 4 slices with one binary\n";
        return 1;
      }
      const auto doc2 = nlohmann::json::parse(render(e2));
      if (doc2.at("patchBase64") != "") {
        std::cerr << "empty patch should encode as empty string\n";
        return 1;
      }
    }

    // Incremental metadata, with characters that need escaping
    {
      gitferry::EnvelopeMetadata meta;
      meta.is_incremental = true;
      meta.base_commit_sha = "0123456789abcdef0123456789abcdef01234567";
      meta.remote_url = "https://github.com/o/r\"x\\y\xc3\xa9";
      const gitferry::Envelope e3{gitferry::describe_source(dir / "a.bundle"),
                                  gitferry::describe_source(dir / "b.patch"), meta};
      const std::string text = render(e3);
      for (unsigned char c : text) {
        if (c >= 0x80) {
          std::cerr << "envelope should be pure ASCII\n";
          return 1;
        }
      }
      const auto doc3 = nlohmann::json::parse(text);
      if (doc3.at("isIncremental") != true || doc3.at("baseCommitSha") != *meta.base_commit_sha ||
          doc3.at("remoteUrl") != *meta.remote_url) {
        std::cerr << "incremental metadata did not round-trip\n";
        return 1;
      }
    }

    // Metadata that is not UTF-8 is rejected as a runtime_error
    {
      gitferry::EnvelopeMetadata meta;
      meta.remote_url = std::string("https://example.com/\xff\xfe.git");
      bool rejected = false;
      try {
        const gitferry::Envelope bad{gitferry::describe_source(dir / "a.bundle"),
                                     gitferry::describe_source(dir / "b.patch"), meta};
      } catch (const std::runtime_error &e) {
        rejected = std::string(e.what()).find("remoteUrl") != std::string::npos;
      }
      if (!rejected) {
        std::cerr << "invalid UTF-8 remote url not reported\n";
        return 1;
      }
    }

    // Out-of-range requests are bugs, never truncated
    bool threw = false;
    try {
      (void)env.resolve(0, env.total_length() + 1);
    } catch (const gitferry::OutOfRangeError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "past-end range not rejected\n";
      return 1;
    }
    threw = false;
    try {
      (void)env.resolve(5, 4);
    } catch (const gitferry::OutOfRangeError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "inverted range not rejected\n";
      return 1;
    }

    std::cout << "envelope_layout OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(dir);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
