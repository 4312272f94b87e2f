#include "delim_cleanse/sanitize.hpp"
#include <simdjson.h>
#include <utf8.h>
#include <cstddef>
#include <cstring>
#include <iterator>

namespace dc {

namespace {

bool replace_byte(std::string& buf, char from) {
  bool hit = false;
  for (char& c : buf) {
    if (c == from) { c = ' '; hit = true; }
  }
  return hit;
}

bool valid_utf8(std::string_view s) {
  return simdjson::validate_utf8(s.data(), s.size());
}

bool contains(std::string_view s, char c) {
  return !s.empty() && std::memchr(s.data(), c, s.size()) != nullptr;
}

// Length of the longest prefix at `p` that could still begin a well-formed
// sequence (always >= 1). That prefix is one malformed sequence; any other
// bad byte stands alone.
std::size_t maximal_subpart(const unsigned char* p, const unsigned char* end) {
  const unsigned char b = *p;
  std::size_t trail = 0;
  unsigned char lo = 0x80, hi = 0xBF;
  if (b >= 0xC2 && b <= 0xDF) {
    trail = 1;
  } else if (b >= 0xE0 && b <= 0xEF) {
    trail = 2;
    if (b == 0xE0) lo = 0xA0;        // overlong
    else if (b == 0xED) hi = 0x9F;   // surrogates
  } else if (b >= 0xF0 && b <= 0xF4) {
    trail = 3;
    if (b == 0xF0) lo = 0x90;        // overlong
    else if (b == 0xF4) hi = 0x8F;   // above U+10FFFF
  } else {
    return 1;
  }
  std::size_t n = 1;
  while (n <= trail && p + n < end && p[n] >= lo && p[n] <= hi) {
    lo = 0x80; hi = 0xBF;
    ++n;
  }
  return n;
}

}

const char* to_string(RepairKind k) noexcept {
  switch (k) {
    case RepairKind::DelimiterReplacement:  return "DelimiterReplacement";
    case RepairKind::TerminatorReplacement: return "TerminatorReplacement";
    case RepairKind::FixedEncoding:         return "FixedEncoding";
  }
  return "Unknown";
}

bool replace_delimiters(std::string& buf, const Dialect& d) {
  return replace_byte(buf, d.delimiter);
}

bool replace_terminators(std::string& buf, const Dialect& d) {
  return replace_byte(buf, d.terminator);
}

bool fix_encoding(std::string& buf, const Dialect&) {
  if (valid_utf8(buf)) return false;
  std::string out;
  out.reserve(buf.size() + 8);
  auto it = buf.cbegin();
  const auto end = buf.cend();
  while (it != end) {
    const auto bad = utf8::find_invalid(it, end);
    out.append(it, bad);
    if (bad == end) break;
    const auto* p = reinterpret_cast<const unsigned char*>(&*bad);
    const std::size_t n = maximal_subpart(p, p + (end - bad));
    utf8::append(0xFFFDu, std::back_inserter(out));
    it = bad + static_cast<std::ptrdiff_t>(n);
  }
  buf.swap(out);
  return true;
}

const std::array<RepairRule, 3>& repair_rules() noexcept {
  static const std::array<RepairRule, 3> rules = {{
    {RepairKind::DelimiterReplacement,  &replace_delimiters},
    {RepairKind::TerminatorReplacement, &replace_terminators},
    {RepairKind::FixedEncoding,         &fix_encoding},
  }};
  return rules;
}

void apply_repairs(std::string& buf, const Dialect& d, std::vector<RepairKind>& kinds) {
  for (const auto& rule : repair_rules()) {
    if (rule.apply(buf, d)) kinds.push_back(rule.kind);
  }
}

SanitizedField sanitize_field(std::string_view field,
                              std::uint64_t record_number,
                              std::uint64_t field_number,
                              const Dialect& d) {
  SanitizedField r;
  r.record_number = record_number;
  r.field_number = field_number;
  r.bytes.assign(field.data(), field.size());
  apply_repairs(r.bytes, d, r.kinds);
  return r;
}

const SanitizedField& FieldSanitizer::sanitize(std::string_view field,
                                               std::uint64_t record_number,
                                               std::uint64_t field_number) {
  out_.record_number = record_number;
  out_.field_number = field_number;
  out_.kinds.clear();
  out_.bytes.assign(field.data(), field.size());

  const bool clean = !contains(field, d_.delimiter)
                  && !contains(field, d_.terminator)
                  && valid_utf8(field);
  if (!clean) apply_repairs(out_.bytes, d_, out_.kinds);
  return out_;
}

}
