#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>
#include <string_view>

namespace dc {

// Reads a byte stream in fixed-size chunks and hands out physical lines
// (terminator stripped). Lines are views into internal buffers and stay
// valid only until the next call.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes    = 512 * 1024;        // 512 KiB
    std::size_t max_line_bytes = 256 * 1024 * 1024; // guard per physical line
    char        terminator     = '\n';
  };

  // "-" reads standard input.
  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config
  // Borrowed stream; never closed by the reader.
  ChunkReader(std::FILE* stream, Config cfg);

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;
  ~ChunkReader();

  // false at end of input or on error; check failed() to tell them apart.
  bool next_line(std::string_view& out);

  using LineCallback = std::function<bool(std::string_view)>;
  bool for_each_line(const LineCallback& cb);

  bool failed() const noexcept;
  int  last_error() const noexcept;
  const std::string& error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
