#include "delim_cleanse/dialect.hpp"
#include <cstdio>

namespace dc {

bool parse_delimiter(std::string_view s, char* out) {
  if (s.size() == 1) { *out = s[0]; return true; }
  if (s == "\\t" || s == "tab")  { *out = '\t'; return true; }
  if (s == "comma")              { *out = ',';  return true; }
  if (s == "pipe")               { *out = '|';  return true; }
  if (s == "semicolon")          { *out = ';';  return true; }
  return false;
}

bool parse_quote_style(std::string_view s, QuoteStyle* out) {
  if (s == "necessary") { *out = QuoteStyle::Necessary; return true; }
  if (s == "always")    { *out = QuoteStyle::Always;    return true; }
  return false;
}

const char* to_string(QuoteStyle s) noexcept {
  switch (s) {
    case QuoteStyle::Necessary: return "necessary";
    case QuoteStyle::Always:    return "always";
  }
  return "unknown";
}

bool validate(const Dialect& d, std::string* err_out) {
  auto fail = [&](const std::string& m){ if (err_out) *err_out = m; return false; };
  // repairs write spaces and U+FFFD, neither may reintroduce these bytes
  auto reserved = [](char c) { return c == ' ' || static_cast<unsigned char>(c) >= 0x80; };
  if (reserved(d.delimiter))
    return fail("delimiter " + describe_byte(d.delimiter) + " must be an ASCII byte other than space");
  if (reserved(d.terminator))
    return fail("terminator " + describe_byte(d.terminator) + " must be an ASCII byte other than space");
  if (d.delimiter == d.quote)      return fail("delimiter and quote must differ");
  if (d.delimiter == d.terminator) return fail("delimiter and terminator must differ");
  if (d.quote == d.terminator)     return fail("quote and terminator must differ");
  if (d.strip_cr && (d.delimiter == '\r' || d.quote == '\r'))
    return fail("'\\r' is reserved for CRLF terminators");
  if (!d.double_quote()) {
    if (d.escape == d.quote || d.escape == d.delimiter || d.escape == d.terminator)
      return fail("escape " + describe_byte(d.escape) + " collides with another dialect byte");
  }
  return true;
}

std::string describe_byte(char c) {
  switch (c) {
    case '\t': return "'\\t'";
    case '\n': return "'\\n'";
    case '\r': return "'\\r'";
    default: break;
  }
  const auto u = static_cast<unsigned char>(c);
  char tmp[8];
  if (u < 0x20 || u >= 0x7f) std::snprintf(tmp, sizeof(tmp), "0x%02x", u);
  else                       std::snprintf(tmp, sizeof(tmp), "'%c'", c);
  return tmp;
}

}
