#include "delim_cleanse/record_reader.hpp"
#include "delim_cleanse/record_view.hpp"
#include <string_view>
#include <utility>
#include <vector>

namespace dc {

struct RecordReader::Impl {
  Dialect d;
  ChunkReader& src;

  // Decoded bytes of the current record; fields are [begin, end) spans.
  std::string buf;
  std::vector<std::pair<std::size_t, std::size_t>> spans;
  std::vector<std::string_view> fields;

  enum class Mode { FieldStart, Unquoted, Quoted, Escape, QuoteEnd } mode = Mode::FieldStart;
  std::size_t field_begin{0};

  void end_field() {
    spans.emplace_back(field_begin, buf.size());
    field_begin = buf.size();
    mode = Mode::FieldStart;
  }

  // Returns false on a byte that cannot follow a closing quote.
  bool scan(std::string_view body, std::uint64_t line_no, std::string& err) {
    for (char c : body) {
      switch (mode) {
        case Mode::FieldStart:
          if (c == d.quote) {
            mode = Mode::Quoted;
          } else if (c == d.delimiter) {
            end_field();
          } else {
            buf.push_back(c);
            mode = Mode::Unquoted;
          }
          break;
        case Mode::Unquoted:
          // quotes inside an unquoted field are data
          if (c == d.delimiter) end_field();
          else buf.push_back(c);
          break;
        case Mode::Quoted:
          if (!d.double_quote() && c == d.escape) mode = Mode::Escape;
          else if (c == d.quote) mode = Mode::QuoteEnd;
          else buf.push_back(c);
          break;
        case Mode::Escape:
          buf.push_back(c);
          mode = Mode::Quoted;
          break;
        case Mode::QuoteEnd:
          if (d.double_quote() && c == d.quote) {
            buf.push_back(c);            // escaped quote
            mode = Mode::Quoted;
          } else if (c == d.delimiter) {
            end_field();
          } else {
            err = "unexpected byte " + describe_byte(c) + " after closing quote at line "
                + std::to_string(line_no);
            return false;
          }
          break;
      }
    }
    return true;
  }
};

RecordReader::RecordReader(const Dialect& dialect, ChunkReader& source)
  : p_(new Impl{dialect, source}) {}

RecordReader::~RecordReader() { delete p_; }

bool RecordReader::next(RecordView& out) {
  if (status_ != Status::Ok) return false;
  Impl& s = *p_;
  s.buf.clear();
  s.spans.clear();
  s.mode = Impl::Mode::FieldStart;
  s.field_begin = 0;

  std::uint64_t start_line = 0;
  std::string_view line;
  while (true) {
    if (!s.src.next_line(line)) {
      if (s.src.failed()) {
        status_ = Status::IoError;
        err_ = s.src.error();
      } else if (start_line == 0) {
        status_ = Status::End;
      } else {
        status_ = Status::ParseError;
        err_ = "unterminated quoted field starting at line " + std::to_string(start_line);
      }
      return false;
    }

    const bool cr = s.d.strip_cr && !line.empty() && line.back() == '\r';
    if (start_line == 0) {
      if (line.empty() || (cr && line.size() == 1)) continue;   // blank line
      start_line = s.src.lines();
    }

    std::string_view body = cr ? line.substr(0, line.size() - 1) : line;
    if (!s.scan(body, s.src.lines(), err_)) {
      status_ = Status::ParseError;
      return false;
    }

    if (s.mode == Impl::Mode::Quoted || s.mode == Impl::Mode::Escape) {
      // terminator inside quotes: keep the raw bytes and read on
      if (cr) s.buf.push_back('\r');
      s.buf.push_back(s.d.terminator);
      s.mode = Impl::Mode::Quoted;
      continue;
    }
    s.end_field();
    break;
  }

  s.fields.clear();
  s.fields.reserve(s.spans.size());
  for (const auto& sp : s.spans)
    s.fields.emplace_back(s.buf.data() + sp.first, sp.second - sp.first);

  out = RecordView(records_, start_line, &s.fields);
  ++records_;
  return true;
}

bool RecordReader::for_each_record(const RecordCallback& on_record) {
  RecordView rv;
  while (next(rv)) {
    if (!on_record(rv)) return true;
  }
  return status_ == Status::End;
}

std::uint64_t RecordReader::bytes_read() const noexcept { return p_->src.bytes_read(); }
std::uint64_t RecordReader::line() const noexcept { return p_->src.lines(); }

const char* to_string(RecordReader::Status s) noexcept {
  switch (s) {
    case RecordReader::Status::Ok:         return "ok";
    case RecordReader::Status::End:        return "end";
    case RecordReader::Status::IoError:    return "io error";
    case RecordReader::Status::ParseError: return "parse error";
  }
  return "unknown";
}

}
