#include "delim_cleanse/chunk_reader.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;
static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static fs::path write_tmp(const std::string& name, const std::string& bytes) {
  fs::path p = fs::temp_directory_path() / ("dc_chunk_" + name);
  std::ofstream out(p, std::ios::binary);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return p;
}

static std::vector<std::string> all_lines(dc::ChunkReader& r) {
  std::vector<std::string> v;
  std::string_view s;
  while (r.next_line(s)) v.emplace_back(s);
  return v;
}

int main(){
  // Tiny chunks force lines to be stitched across chunk boundaries.
  {
    const std::string data = "alpha,beta\n\ngamma\r\nlast-without-newline";
    auto p = write_tmp("stitch.csv", data);
    dc::ChunkReader::Config cfg; cfg.chunk_bytes = 3;
    dc::ChunkReader r(p.string(), cfg);
    auto lines = all_lines(r);
    expect(!r.failed(), "stitch: reader failed: " + r.error());
    expect(lines.size() == 4, "stitch: expected 4 lines, got " + std::to_string(lines.size()));
    if (lines.size() == 4) {
      expect(lines[0] == "alpha,beta", "stitch: line 1");
      expect(lines[1].empty(), "stitch: blank line kept");
      expect(lines[2] == "gamma\r", "stitch: CR left for the tokenizer");
      expect(lines[3] == "last-without-newline", "stitch: unterminated tail");
    }
    expect(r.bytes_read() == data.size(), "stitch: bytes_read");
    expect(r.lines() == 4, "stitch: lines()");
  }

  // for_each_line stops when the callback says so.
  {
    auto p = write_tmp("stop.csv", "1\n2\n3\n");
    dc::ChunkReader r(p.string());
    int n = 0;
    bool ok = r.for_each_line([&](std::string_view){ return ++n < 2; });
    expect(ok && n == 2, "for_each_line: early stop");
  }

  // Custom terminator byte.
  {
    auto p = write_tmp("nul.bin", std::string("a\0b\0", 4));
    dc::ChunkReader::Config cfg; cfg.terminator = '\0';
    dc::ChunkReader r(p.string(), cfg);
    auto lines = all_lines(r);
    expect(lines.size() == 2 && lines[0] == "a" && lines[1] == "b", "custom terminator");
  }

  // Missing file is an I/O error, not end of input.
  {
    dc::ChunkReader r((fs::temp_directory_path() / "dc_chunk_does_not_exist.csv").string());
    std::string_view s;
    expect(!r.next_line(s), "missing: next_line returns false");
    expect(r.failed() && r.last_error() == ENOENT, "missing: ENOENT reported");
  }

  // Line guard.
  {
    auto p = write_tmp("long.csv", std::string(100, 'x') + "\nshort\n");
    dc::ChunkReader::Config cfg; cfg.chunk_bytes = 16; cfg.max_line_bytes = 50;
    dc::ChunkReader r(p.string(), cfg);
    std::string_view s;
    expect(!r.next_line(s), "guard: oversize line rejected");
    expect(r.failed() && r.last_error() == EFBIG, "guard: EFBIG reported");
  }

  // Fixture from the repo.
  {
    const fs::path f = "tests/data/utf8.csv";
    if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }
    dc::ChunkReader r(f.string(), {});
    std::uint64_t lines = 0;
    bool ok = r.for_each_line([&](std::string_view){ ++lines; return true; });
    expect(ok && lines == 4, "fixture: utf8.csv has 4 lines");
    expect(r.bytes_read() == fs::file_size(f), "fixture: bytes_read == file_size");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] chunk_reader\n";
  return 0;
}
