#pragma once
#include "delim_cleanse/chunk_reader.hpp"
#include "delim_cleanse/dialect.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace dc {

class RecordView;

// Quote-aware tokenizer stitching physical lines from a ChunkReader into
// logical records. A quoted field may span lines; its embedded terminators
// are kept in the field value.
class RecordReader {
public:
  enum class Status { Ok, End, IoError, ParseError };

  RecordReader(const Dialect& dialect, ChunkReader& source);
  RecordReader(const RecordReader&) = delete;
  RecordReader& operator=(const RecordReader&) = delete;
  ~RecordReader();

  // Pull the next record. The view stays valid until the next call.
  bool next(RecordView& out);

  using RecordCallback = std::function<bool(const RecordView&)>;
  // Push-style loop over next(); the callback returns false to stop early.
  bool for_each_record(const RecordCallback& on_record);

  Status status() const noexcept { return status_; }
  const std::string& error() const { return err_; }
  std::uint64_t records() const noexcept { return records_; }
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t line() const noexcept;

private:
  struct Impl; Impl* p_;
  Status status_{Status::Ok};
  std::uint64_t records_{0};
  std::string err_;
};

const char* to_string(RecordReader::Status s) noexcept;

}
