#pragma once
#include <cstdint>
#include <string>

namespace dc {

class RecordReader;
class RecordWriter;
class FieldSanitizer;
class AuditReporter;
class MetricsRegistry;

struct CleanseOptions {
  // Added to the reader's 0-based ordinals before numbers reach the
  // sanitizer and the audit trail.
  std::uint64_t index_base = 1;
};

enum class Outcome { Ok, BrokenPipe, IoError, ParseError };

struct CleanseResult {
  Outcome outcome = Outcome::Ok;
  std::string error;
  std::uint64_t records = 0;
  std::uint64_t repaired_fields = 0;

  bool ok() const noexcept { return outcome == Outcome::Ok || outcome == Outcome::BrokenPipe; }
};

// Streams every record from `reader` through `sanitizer` into `writer`,
// reporting each repaired field after it has been written. Stops at the
// first parse or I/O error; records already written are flushed.
// `metrics` may be null.
CleanseResult cleanse(RecordReader& reader,
                      FieldSanitizer& sanitizer,
                      RecordWriter& writer,
                      AuditReporter& audit,
                      MetricsRegistry* metrics,
                      const CleanseOptions& opts = {});

const char* to_string(Outcome o) noexcept;

// 0 for Ok/BrokenPipe, 2 for I/O errors, 3 for parse errors.
int exit_code(Outcome o) noexcept;

}
