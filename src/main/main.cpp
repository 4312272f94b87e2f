#include "delim_cleanse/audit.hpp"
#include "delim_cleanse/chunk_reader.hpp"
#include "delim_cleanse/cleanse.hpp"
#include "delim_cleanse/dialect.hpp"
#include "delim_cleanse/metrics.hpp"
#include "delim_cleanse/path_utils.hpp"
#include "delim_cleanse/record_reader.hpp"
#include "delim_cleanse/record_writer.hpp"
#include "delim_cleanse/run_json.hpp"
#include "delim_cleanse/sanitize.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace {

constexpr const char* kUsage =
  "Usage: cleanse [options] -o <output|-> <input|->\n"
  "\n"
  "Repairs every field of a delimited file so it is safe for line tools:\n"
  "  1. delimiter bytes inside a field become spaces\n"
  "  2. newlines inside a field become spaces\n"
  "  3. invalid UTF-8 is replaced with U+FFFD\n"
  "Each repaired field is logged as an audit entry.\n"
  "\n"
  "Options:\n"
  "  -d, --delimiter=C        field delimiter, one byte or tab|comma|pipe|semicolon (default: tab)\n"
  "  -o, --output=PATH        output path, \"-\" for stdout (required)\n"
  "      --quote=C            quote byte (default: \")\n"
  "      --escape=C           escape byte inside quotes (default: doubled quotes)\n"
  "      --quote-style=S      necessary|always (default: necessary)\n"
  "      --audit-log=PATH     write the audit log to PATH instead of stderr\n"
  "      --audit-format=F     text|json (default: text)\n"
  "      --log-level=L        trace|debug|info|warn|error|critical|off (default: info, env SPDLOG_LEVEL)\n"
  "      --index-base=N       first record/field number in the audit log (default: 1)\n"
  "      --chunk-bytes=N      input read size (default: 524288)\n"
  "      --summary=PATH       write a JSON run summary to PATH\n"
  "      --no-color           plain stderr logging\n"
  "  -h, --help               show this help\n";

struct Cli {
  dc::Dialect dialect;
  std::string input;
  std::string output;
  std::string summary;
  dc::LogConfig log;
  dc::AuditReporter::Format audit_format = dc::AuditReporter::Format::Text;
  std::uint64_t index_base = 1;
  std::size_t chunk_bytes = 512 * 1024;
};

template <typename T>
bool parse_uint(const std::string& s, T* out) {
  const char* b = s.data();
  const char* e = b + s.size();
  auto r = std::from_chars(b, e, *out);
  return r.ec == std::errc() && r.ptr == e;
}

bool usage_error(const std::string& msg) {
  std::cerr << "cleanse: " << msg << "\n\n" << kUsage;
  return false;
}

bool parse_cli(int argc, char** argv, Cli& c) {
  bool have_output = false;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    // "--key=value", "--key value" and "-k value" all accepted
    auto eat = [&](const char* lng, const char* shrt, std::string* out){
      const std::string pfx = std::string(lng) + "=";
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(pfx.size()); return true; }
      if ((a == lng || (shrt && a == shrt)) && i + 1 < argc) { *out = argv[++i]; return true; }
      return false;
    };
    std::string v;
    if (eat("--delimiter", "-d", &v)) {
      if (!dc::parse_delimiter(v, &c.dialect.delimiter))
        return usage_error("delimiter must be a single byte, got \"" + v + "\"");
      continue;
    }
    if (eat("--quote", nullptr, &v)) {
      if (v.size() != 1) return usage_error("quote must be a single byte");
      c.dialect.quote = v[0];
      continue;
    }
    if (eat("--escape", nullptr, &v)) {
      if (v.size() != 1) return usage_error("escape must be a single byte");
      c.dialect.escape = v[0];
      continue;
    }
    if (eat("--quote-style", nullptr, &v)) {
      if (!dc::parse_quote_style(v, &c.dialect.quote_style))
        return usage_error("quote style must be necessary or always");
      continue;
    }
    if (eat("--output", "-o", &c.output)) { have_output = true; continue; }
    if (eat("--audit-log", nullptr, &c.log.file)) continue;
    if (eat("--audit-format", nullptr, &v)) {
      if (!dc::parse_audit_format(v, &c.audit_format))
        return usage_error("audit format must be text or json");
      continue;
    }
    if (eat("--log-level", nullptr, &c.log.level)) continue;
    if (eat("--index-base", nullptr, &v)) {
      if (!parse_uint(v, &c.index_base)) return usage_error("bad --index-base: " + v);
      continue;
    }
    if (eat("--chunk-bytes", nullptr, &v)) {
      if (!parse_uint(v, &c.chunk_bytes) || c.chunk_bytes == 0)
        return usage_error("bad --chunk-bytes: " + v);
      continue;
    }
    if (eat("--summary", nullptr, &c.summary)) continue;
    if (a == "--no-color") { c.log.color = false; continue; }
    if (a == "-h" || a == "--help") {
      std::cout << kUsage;
      std::exit(0);
    }
    if (a.size() > 1 && a[0] == '-') return usage_error("unknown option " + a);
    if (!c.input.empty()) return usage_error("only one input file may be given");
    c.input = a;
  }
  if (c.input.empty()) return usage_error("missing input file (use - for stdin)");
  if (!have_output || c.output.empty()) return usage_error("missing --output (use - for stdout)");
  return true;
}

bool same_file(const std::string& a, const std::string& b) {
  if (dc::is_stdio_path(a) || dc::is_stdio_path(b)) return false;
  std::error_code ec1, ec2;
  auto pa = std::filesystem::weakly_canonical(a, ec1);
  auto pb = std::filesystem::weakly_canonical(b, ec2);
  return !ec1 && !ec2 && pa == pb;
}

}

int main(int argc, char** argv) {
  // a closed downstream pipe surfaces as EPIPE from fwrite instead
  std::signal(SIGPIPE, SIG_IGN);

  Cli cli;
  if (!parse_cli(argc, argv, cli)) return 1;

  std::string err;
  auto log = dc::make_logger(cli.log, &err);
  if (!log) {
    std::cerr << "cleanse: cannot set up logging: " << err << "\n";
    return 1;
  }

  if (!dc::validate(cli.dialect, &err)) {
    log->error("invalid dialect: {}", err);
    return 1;
  }
  if (same_file(cli.input, cli.output)) {
    log->error("refusing to overwrite the input file {}", cli.input);
    return 1;
  }

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  dc::ChunkReader::Config rcfg;
  rcfg.chunk_bytes = cli.chunk_bytes;
  rcfg.terminator = cli.dialect.terminator;
  dc::ChunkReader source(cli.input, rcfg);
  dc::RecordReader reader(cli.dialect, source);

  dc::RecordWriter writer(cli.dialect, cli.output);
  if (writer.failed()) {
    log->error("{}", writer.error());
    return 2;
  }

  dc::FieldSanitizer sanitizer(cli.dialect);
  dc::AuditReporter audit(log, cli.audit_format);
  dc::MetricsRegistry metrics;

  dc::CleanseOptions opts;
  opts.index_base = cli.index_base;
  dc::CleanseResult res = dc::cleanse(reader, sanitizer, writer, audit, &metrics, opts);

  if (!writer.close() && res.outcome == dc::Outcome::Ok) {
    res.outcome = writer.broken_pipe() ? dc::Outcome::BrokenPipe : dc::Outcome::IoError;
    res.error = writer.error();
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  const dc::RunStats stats = metrics.snapshot(wall_ms);

  const std::string in_name = dc::display_name(cli.input, false);
  const std::string out_name = dc::display_name(cli.output, true);
  switch (res.outcome) {
    case dc::Outcome::Ok:
      log->debug("cleansed {} records ({} fields) from {} into {}: {} repaired fields in {:.1f} ms",
                 stats.records, stats.fields, in_name, out_name, stats.repaired_fields, wall_ms);
      break;
    case dc::Outcome::BrokenPipe:
      log->debug("output pipe closed after {} records", res.records);
      break;
    case dc::Outcome::IoError:
    case dc::Outcome::ParseError:
      log->error("{}: {} (after {} records)", dc::to_string(res.outcome), res.error, res.records);
      break;
  }

  if (!cli.summary.empty()) {
    dc::RunJsonPayload p;
    p.stats = stats;
    p.audit_entries = audit.entries();
    p.status = dc::to_string(res.outcome);
    p.error = res.error;
    p.input = in_name;
    p.output = out_name;
    p.delimiter = cli.dialect.delimiter;
    if (!dc::RunJsonWriter::write_file(cli.summary, p, &err)) {
      log->error("summary: {}", err);
      if (res.ok()) res.outcome = dc::Outcome::IoError;
    }
  }

  log->flush();
  return dc::exit_code(res.outcome);
}
