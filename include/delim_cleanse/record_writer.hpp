#pragma once
#include "delim_cleanse/dialect.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace dc {

// True when `field` must be quoted to survive a re-parse with `d`.
// Empty single-field records are handled by the writer, not here.
bool needs_quotes(std::string_view field, const Dialect& d) noexcept;

// Serializes records in the dialect's wire format through an output buffer.
// Any failed write is sticky: later calls return false without writing.
class RecordWriter {
public:
  struct Config {
    std::size_t buffer_bytes = 256 * 1024;
  };

  // "-" writes standard output; parent directories are created.
  RecordWriter(const Dialect& d, std::string path);      // uses default Config{}
  RecordWriter(const Dialect& d, std::string path, Config cfg);
  // Borrowed stream; flushed but never closed by the writer.
  RecordWriter(const Dialect& d, std::FILE* stream);
  RecordWriter(const Dialect& d, std::FILE* stream, Config cfg);

  RecordWriter(const RecordWriter&) = delete;
  RecordWriter& operator=(const RecordWriter&) = delete;
  ~RecordWriter();

  bool write_field(std::string_view field);
  bool end_record();
  bool write_record(const std::vector<std::string_view>& fields);

  bool flush();
  // Flush and release the stream; reports close errors (e.g. ENOSPC).
  bool close();

  bool failed() const noexcept { return last_errno_ != 0 || !err_.empty(); }
  // The consumer went away (EPIPE); callers treat this as a clean stop.
  bool broken_pipe() const noexcept;
  int  last_error() const noexcept { return last_errno_; }
  const std::string& error() const noexcept { return err_; }
  std::uint64_t bytes_written() const noexcept { return bytes_; }
  std::uint64_t records_written() const noexcept { return records_; }

private:
  bool put(std::string_view s);
  bool put(char c);
  bool drain();
  void fail(const std::string& what, int e);

  Dialect d_;
  Config cfg_;
  std::string path_;
  std::FILE* f_{nullptr};
  bool owns_{false};
  std::string buf_;
  std::size_t fields_in_record_{0};
  bool pending_empty_{false};
  int last_errno_{0};
  std::string err_;
  std::uint64_t bytes_{0};
  std::uint64_t records_{0};
};

}
