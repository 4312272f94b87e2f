#pragma once
#include "delim_cleanse/dialect.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dc {

enum class RepairKind : std::uint8_t {
  DelimiterReplacement,
  TerminatorReplacement,
  FixedEncoding,
};

const char* to_string(RepairKind k) noexcept;

// One field after the repair pass. `kinds` lists the rules that fired, in
// rule order; empty means `bytes` equals the input.
struct SanitizedField {
  std::uint64_t record_number = 0;
  std::uint64_t field_number = 0;
  std::string bytes;
  std::vector<RepairKind> kinds;

  bool repaired() const noexcept { return !kinds.empty(); }
};

// A repair step rewrites `buf` in place and reports whether anything changed.
struct RepairRule {
  RepairKind kind;
  bool (*apply)(std::string& buf, const Dialect& d);
};

// Every dialect delimiter byte becomes a space.
bool replace_delimiters(std::string& buf, const Dialect& d);
// Every terminator byte becomes a space.
bool replace_terminators(std::string& buf, const Dialect& d);
// Malformed UTF-8 becomes U+FFFD: one per truncated sequence, one per
// byte otherwise (overlongs, surrogates and stray bytes are not collapsed).
bool fix_encoding(std::string& buf, const Dialect& d);

// Delimiter, terminator, encoding. Byte-level rules run before the text
// check so the validator never sees structural bytes.
const std::array<RepairRule, 3>& repair_rules() noexcept;

// Left fold of repair_rules() over `buf`; appends fired kinds to `kinds`.
void apply_repairs(std::string& buf, const Dialect& d, std::vector<RepairKind>& kinds);

// Pure form: copies the field, repairs it, returns bytes and kinds.
SanitizedField sanitize_field(std::string_view field,
                              std::uint64_t record_number,
                              std::uint64_t field_number,
                              const Dialect& d);

// Hot-path form reusing one result buffer across calls. Clean fields are
// detected with a scan plus a SIMD UTF-8 check and skip the rule fold.
class FieldSanitizer {
public:
  explicit FieldSanitizer(const Dialect& d) : d_(d) {}

  // The reference stays valid until the next call.
  const SanitizedField& sanitize(std::string_view field,
                                 std::uint64_t record_number,
                                 std::uint64_t field_number);

private:
  Dialect d_;
  SanitizedField out_;
};

}
