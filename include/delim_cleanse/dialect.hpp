#pragma once
#include <string>
#include <string_view>

namespace dc {

enum class QuoteStyle { Necessary, Always };

// Byte-level description of the delimited format. Shared by reader, writer
// and sanitizer so the output re-parses with the same rules it was read with.
struct Dialect {
  char delimiter   = '\t';
  char quote       = '"';
  char escape      = '\0';  // '\0' -> quotes are escaped by doubling
  char terminator  = '\n';
  bool strip_cr    = true;  // "\r\n" outside quotes ends a record too
  QuoteStyle quote_style = QuoteStyle::Necessary;

  bool double_quote() const noexcept { return escape == '\0'; }
};

// Accepts a single byte or one of the names "tab", "comma", "pipe",
// "semicolon", and the two-char spelling "\t".
bool parse_delimiter(std::string_view s, char* out);

bool parse_quote_style(std::string_view s, QuoteStyle* out);

const char* to_string(QuoteStyle s) noexcept;

// Rejects dialects the reader could not parse unambiguously (delimiter,
// quote, escape and terminator must be distinct bytes) and dialects whose
// delimiter or terminator is space or a non-ASCII byte, which the repairs
// would write back into a field.
bool validate(const Dialect& d, std::string* err_out = nullptr);

// Printable form of a dialect byte for diagnostics ("\\t", "','", "0x1f").
std::string describe_byte(char c);

}
