#include "delim_cleanse/cleanse.hpp"
#include "delim_cleanse/audit.hpp"
#include "delim_cleanse/metrics.hpp"
#include "delim_cleanse/record_reader.hpp"
#include "delim_cleanse/record_view.hpp"
#include "delim_cleanse/record_writer.hpp"
#include "delim_cleanse/sanitize.hpp"

namespace dc {

static Outcome writer_outcome(const RecordWriter& w) {
  return w.broken_pipe() ? Outcome::BrokenPipe : Outcome::IoError;
}

CleanseResult cleanse(RecordReader& reader,
                      FieldSanitizer& sanitizer,
                      RecordWriter& writer,
                      AuditReporter& audit,
                      MetricsRegistry* metrics,
                      const CleanseOptions& opts) {
  CleanseResult res;
  if (metrics) metrics->start_stage("cleanse");

  RecordView rv;
  bool write_ok = true;
  while (write_ok && reader.next(rv)) {
    const std::uint64_t record_number = opts.index_base + rv.ordinal();
    for (std::size_t i = 0; i < rv.size(); ++i) {
      const std::uint64_t field_number = opts.index_base + i;
      const SanitizedField& f = sanitizer.sanitize(rv.at(i), record_number, field_number);
      if (!writer.write_field(f.bytes)) { write_ok = false; break; }
      if (f.repaired()) {
        audit.report(f);
        ++res.repaired_fields;
        if (metrics) metrics->add_repairs(f.kinds);
      }
    }
    if (write_ok && !writer.end_record()) write_ok = false;
    if (!write_ok) break;
    ++res.records;
    if (metrics) metrics->add_record(rv.size());
  }

  if (metrics) metrics->end_stage("cleanse");

  if (!write_ok) {
    res.outcome = writer_outcome(writer);
    res.error = writer.error();
  } else if (reader.status() == RecordReader::Status::IoError) {
    res.outcome = Outcome::IoError;
    res.error = reader.error();
  } else if (reader.status() == RecordReader::Status::ParseError) {
    res.outcome = Outcome::ParseError;
    res.error = reader.error();
  }

  if (metrics) metrics->start_stage("flush");
  if (!writer.flush() && res.outcome == Outcome::Ok) {
    res.outcome = writer_outcome(writer);
    res.error = writer.error();
  }
  if (metrics) {
    metrics->end_stage("flush");
    metrics->set_bytes_in(reader.bytes_read());
    metrics->set_bytes_out(writer.bytes_written());
  }
  return res;
}

const char* to_string(Outcome o) noexcept {
  switch (o) {
    case Outcome::Ok:         return "ok";
    case Outcome::BrokenPipe: return "broken pipe";
    case Outcome::IoError:    return "io error";
    case Outcome::ParseError: return "parse error";
  }
  return "unknown";
}

int exit_code(Outcome o) noexcept {
  switch (o) {
    case Outcome::Ok:
    case Outcome::BrokenPipe: return 0;
    case Outcome::IoError:    return 2;
    case Outcome::ParseError: return 3;
  }
  return 2;
}

}
