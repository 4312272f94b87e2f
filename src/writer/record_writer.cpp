#include "delim_cleanse/record_writer.hpp"
#include "delim_cleanse/path_utils.hpp"
#include <cerrno>
#include <cstring>
#include <utility>

namespace dc {

bool needs_quotes(std::string_view field, const Dialect& d) noexcept {
  for (char c : field) {
    if (c == d.delimiter || c == d.quote || c == d.terminator || c == '\r' || c == '\n')
      return true;
  }
  return false;
}

RecordWriter::RecordWriter(const Dialect& d, std::string path)
  : RecordWriter(d, std::move(path), Config{}) {}

RecordWriter::RecordWriter(const Dialect& d, std::FILE* stream)
  : RecordWriter(d, stream, Config{}) {}

RecordWriter::RecordWriter(const Dialect& d, std::string path, Config cfg)
  : d_(d), cfg_(cfg), path_(std::move(path)) {
  if (is_stdio_path(path_)) {
    f_ = stdout;
  } else {
    if (!ensure_parent_dirs(path_)) { fail("cannot create parent directories for " + path_, errno); return; }
    f_ = std::fopen(path_.c_str(), "wb");
    if (!f_) { fail("cannot open " + path_, errno); return; }
    owns_ = true;
  }
  buf_.reserve(cfg_.buffer_bytes);
}

RecordWriter::RecordWriter(const Dialect& d, std::FILE* stream, Config cfg)
  : d_(d), cfg_(cfg), path_("<stream>"), f_(stream) {
  buf_.reserve(cfg_.buffer_bytes);
}

RecordWriter::~RecordWriter() {
  if (f_) (void)close();
}

void RecordWriter::fail(const std::string& what, int e) {
  if (failed()) return;            // keep the first error
  last_errno_ = e;
  err_ = what;
  if (e != 0) { err_ += ": "; err_ += std::strerror(e); }
}

bool RecordWriter::broken_pipe() const noexcept { return last_errno_ == EPIPE; }

bool RecordWriter::drain() {
  if (failed() || !f_) return false;
  if (buf_.empty()) return true;
  const std::size_t n = std::fwrite(buf_.data(), 1, buf_.size(), f_);
  if (n != buf_.size()) {
    fail("write error on " + path_, errno ? errno : EIO);
    return false;
  }
  bytes_ += n;
  buf_.clear();
  return true;
}

bool RecordWriter::put(std::string_view s) {
  buf_.append(s.data(), s.size());
  if (buf_.size() >= cfg_.buffer_bytes) return drain();
  return !failed();
}

bool RecordWriter::put(char c) {
  buf_.push_back(c);
  if (buf_.size() >= cfg_.buffer_bytes) return drain();
  return !failed();
}

bool RecordWriter::write_field(std::string_view field) {
  if (failed() || !f_) return false;
  if (fields_in_record_ > 0 && !put(d_.delimiter)) return false;
  pending_empty_ = false;
  ++fields_in_record_;

  const bool quote = d_.quote_style == QuoteStyle::Always || needs_quotes(field, d_);
  if (!quote) {
    // an empty first field becomes `""` if the record ends here
    if (field.empty() && fields_in_record_ == 1) pending_empty_ = true;
    return put(field);
  }

  if (!put(d_.quote)) return false;
  std::size_t run = 0;
  for (std::size_t i = 0; i < field.size(); ++i) {
    const char c = field[i];
    const bool esc = (c == d_.quote) || (!d_.double_quote() && c == d_.escape);
    if (!esc) continue;
    if (!put(field.substr(run, i - run))) return false;
    if (!put(d_.double_quote() ? d_.quote : d_.escape)) return false;
    run = i;                       // the byte itself goes out with the next run
  }
  if (!put(field.substr(run))) return false;
  return put(d_.quote);
}

bool RecordWriter::end_record() {
  if (failed() || !f_) return false;
  if (pending_empty_) {
    if (!put(d_.quote) || !put(d_.quote)) return false;
    pending_empty_ = false;
  }
  fields_in_record_ = 0;
  if (!put(d_.terminator)) return false;
  ++records_;
  return true;
}

bool RecordWriter::write_record(const std::vector<std::string_view>& fields) {
  for (auto f : fields) {
    if (!write_field(f)) return false;
  }
  return end_record();
}

bool RecordWriter::flush() {
  if (!drain()) return false;
  if (std::fflush(f_) != 0) { fail("flush error on " + path_, errno); return false; }
  return true;
}

bool RecordWriter::close() {
  if (!f_) return !failed();
  bool ok = failed() ? false : flush();
  if (owns_) {
    if (std::fclose(f_) != 0 && ok) { fail("close error on " + path_, errno); ok = false; }
  }
  f_ = nullptr;
  return ok;
}

}
