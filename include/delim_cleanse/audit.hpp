#pragma once
#include "delim_cleanse/sanitize.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace dc {

// "[DelimiterReplacement, FixedEncoding]" without the brackets.
std::string join_kinds(const std::vector<RepairKind>& kinds);

// Emits one info-level entry per repaired field, immediately and in call
// order. Numbers are logged as given; callers pass human-facing values.
class AuditReporter {
public:
  enum class Format { Text, Json };

  explicit AuditReporter(std::shared_ptr<spdlog::logger> logger,
                         Format fmt = Format::Text);

  // No-op when `kinds` is empty.
  void report(std::uint64_t record_number, std::uint64_t field_number,
              const std::vector<RepairKind>& kinds);
  void report(const SanitizedField& f) { report(f.record_number, f.field_number, f.kinds); }

  std::uint64_t entries() const noexcept { return entries_; }

private:
  std::shared_ptr<spdlog::logger> log_;
  Format fmt_;
  std::uint64_t entries_{0};
};

bool parse_audit_format(const std::string& s, AuditReporter::Format* out);

// Logger shared by the audit trail and operator diagnostics.
struct LogConfig {
  std::string name = "cleanse";
  std::string file;           // empty -> stderr
  std::string level;          // empty -> info, then SPDLOG_LEVEL
  bool color = true;
};

inline constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

// Builds and registers the logger; nullptr with *err_out set on failure.
std::shared_ptr<spdlog::logger> make_logger(const LogConfig& cfg, std::string* err_out);

}
