#pragma once
#include "delim_cleanse/metrics.hpp"
#include <cstdint>
#include <string>

namespace dc {

struct RunJsonPayload {
  RunStats stats;
  std::uint64_t audit_entries = 0;

  // Outcome: "ok", "io error", "parse error".
  std::string status = "ok";
  std::string error;

  // Stream metadata
  std::string input;
  std::string output;
  char delimiter = '\t';
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON object.
  static std::string to_json(const RunJsonPayload& p);

  // Write to_json(p) plus a newline to `path`.
  static bool write_file(const std::string& path, const RunJsonPayload& p,
                         std::string* err_out = nullptr);
};

}
