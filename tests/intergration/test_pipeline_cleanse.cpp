#include "delim_cleanse/audit.hpp"
#include "delim_cleanse/chunk_reader.hpp"
#include "delim_cleanse/cleanse.hpp"
#include "delim_cleanse/metrics.hpp"
#include "delim_cleanse/record_reader.hpp"
#include "delim_cleanse/record_view.hpp"
#include "delim_cleanse/record_writer.hpp"
#include "delim_cleanse/sanitize.hpp"

#include <simdjson.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;
static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

struct Run {
  dc::CleanseResult res;
  dc::RunStats stats;
  std::string output;
  std::vector<std::string> audit;
};

static Run run(const std::string& input, const dc::Dialect& d,
               const dc::CleanseOptions& opts = {}, std::size_t chunk = 64 * 1024) {
  static int seq = 0;
  const fs::path dir = fs::temp_directory_path() / "dc_pipeline";
  fs::create_directories(dir);
  const fs::path in = dir / ("in_" + std::to_string(++seq));
  const fs::path out = dir / ("out_" + std::to_string(seq));
  { std::ofstream o(in, std::ios::binary); o.write(input.data(), static_cast<std::streamsize>(input.size())); }

  std::ostringstream os;
  auto log = std::make_shared<spdlog::logger>("pipeline_test",
               std::make_shared<spdlog::sinks::ostream_sink_mt>(os));
  log->set_pattern("%v");
  log->set_level(spdlog::level::info);

  Run r;
  {
    dc::ChunkReader::Config rcfg; rcfg.chunk_bytes = chunk; rcfg.terminator = d.terminator;
    dc::ChunkReader src(in.string(), rcfg);
    dc::RecordReader reader(d, src);
    dc::RecordWriter writer(d, out.string());
    dc::FieldSanitizer sanitizer(d);
    dc::AuditReporter audit(log);
    dc::MetricsRegistry metrics;
    r.res = dc::cleanse(reader, sanitizer, writer, audit, &metrics, opts);
    expect(writer.close(), "writer.close");
    r.stats = metrics.snapshot(1.0);
  }
  std::ifstream i(out, std::ios::binary);
  r.output.assign(std::istreambuf_iterator<char>(i), {});
  std::istringstream lines(os.str());
  for (std::string l; std::getline(lines, l);) r.audit.push_back(l);
  return r;
}

static std::vector<std::vector<std::string>> parse_all(const std::string& bytes, const dc::Dialect& d) {
  const fs::path p = fs::temp_directory_path() / "dc_pipeline" / "reparse";
  { std::ofstream o(p, std::ios::binary); o << bytes; }
  dc::ChunkReader src(p.string());
  dc::RecordReader rd(d, src);
  std::vector<std::vector<std::string>> rows;
  dc::RecordView rv;
  while (rd.next(rv)) {
    std::vector<std::string> row;
    for (std::size_t i = 0; i < rv.size(); ++i) row.emplace_back(rv.at(i));
    rows.push_back(std::move(row));
  }
  expect(rd.status() == dc::RecordReader::Status::End, "reparse clean: " + rd.error());
  return rows;
}

static void check_invariants(const std::string& output, const dc::Dialect& d, const std::string& label) {
  for (const auto& row : parse_all(output, d)) {
    for (const auto& f : row) {
      expect(f.find(d.delimiter) == std::string::npos, label + ": delimiter in output field");
      expect(f.find(d.terminator) == std::string::npos, label + ": terminator in output field");
      expect(simdjson::validate_utf8(f.data(), f.size()), label + ": invalid utf8 in output field");
    }
  }
}

int main(){
  dc::Dialect comma; comma.delimiter = ',';

  // the reference example of the original tool
  {
    const std::string in = "a,b,c,d\n1,\"2,3\",4,5\nthis,is,\"a\nvery gross\",li\xff" "e\n";
    Run r = run(in, comma);
    expect(r.res.outcome == dc::Outcome::Ok, "simple: ok");
    expect(r.output == "a,b,c,d\n1,2 3,4,5\nthis,is,a very gross,li\xEF\xBF\xBD" "e\n", "simple: output bytes");
    expect(r.audit == std::vector<std::string>{
             "Record number 2, field number 2: [DelimiterReplacement]",
             "Record number 3, field number 3: [TerminatorReplacement]",
             "Record number 3, field number 4: [FixedEncoding]"}, "simple: audit trail");
    expect(r.res.records == 3 && r.res.repaired_fields == 3, "simple: result counters");
    expect(r.stats.repairs(dc::RepairKind::DelimiterReplacement) == 1, "simple: metrics by kind");

    // idempotence: second pass is byte-identical with an empty audit log
    Run again = run(r.output, comma);
    expect(again.output == r.output, "idempotent output");
    expect(again.audit.empty() && again.res.repaired_fields == 0, "idempotent audit");
  }

  // all three repairs in one field, numbering base 0
  {
    dc::CleanseOptions opts; opts.index_base = 0;
    Run r = run("\"a,b\nc\x80\"\n", comma, opts);
    expect(r.output == "a b c\xEF\xBF\xBD\n", "three repairs: output");
    expect(r.audit == std::vector<std::string>{
             "Record number 0, field number 0: [DelimiterReplacement, TerminatorReplacement, FixedEncoding]"},
           "three repairs: audit with base 0");
  }

  // round-trip structure: same record and field counts
  {
    const std::string in = "h1,h2,h3\n\"x,y\",,\"\"\"q\"\"\"\n\"\"\n\"multi\nline\",\xc3\xa9,\xff\n";
    Run r = run(in, comma);
    auto src = parse_all(in, comma);
    auto dst = parse_all(r.output, comma);
    bool same = src.size() == dst.size();
    for (std::size_t i = 0; same && i < src.size(); ++i) same = src[i].size() == dst[i].size();
    expect(same, "round trip keeps record/field counts");
    expect(dst.size() == 4 && dst[2].size() == 1 && dst[2][0].empty(), "lone empty field survives");
    expect(dst[1][2] == "\"q\"", "quotes survive re-quoting");
    check_invariants(r.output, comma, "round trip");
  }

  // audit completeness: entry iff the field changed, in lexicographic order
  {
    const std::string in = "ok,\"a,b\",\xfe\n\"n\nl\",ok,ok\n";
    Run r = run(in, comma);
    auto src = parse_all(in, comma);
    auto dst = parse_all(r.output, comma);
    std::vector<std::string> want;
    for (std::size_t i = 0; i < src.size(); ++i)
      for (std::size_t j = 0; j < src[i].size(); ++j)
        if (src[i][j] != dst[i][j])
          want.push_back("Record number " + std::to_string(i + 1) + ", field number " + std::to_string(j + 1));
    expect(want.size() == r.audit.size(), "one entry per changed field");
    for (std::size_t k = 0; k < want.size() && k < r.audit.size(); ++k)
      expect(r.audit[k].rfind(want[k], 0) == 0, "entry order: " + r.audit[k]);
  }

  // parse errors stop the run; earlier records are flushed
  {
    Run r = run("a,b\n1,2\n3,\"open\n", comma);
    expect(r.res.outcome == dc::Outcome::ParseError, "parse error outcome");
    expect(dc::exit_code(r.res.outcome) == 3, "parse error exit code");
    expect(r.output == "a,b\n1,2\n", "records before the error are written");
  }

  // missing input is an io error
  {
    const fs::path missing = fs::temp_directory_path() / "dc_pipeline_missing.csv";
    dc::ChunkReader src(missing.string());
    dc::RecordReader reader(comma, src);
    std::FILE* sink = std::tmpfile();
    dc::RecordWriter writer(comma, sink);
    dc::FieldSanitizer sanitizer(comma);
    auto log = std::make_shared<spdlog::logger>("pipeline_missing");
    dc::AuditReporter audit(log);
    auto res = dc::cleanse(reader, sanitizer, writer, audit, nullptr);
    expect(res.outcome == dc::Outcome::IoError && !res.error.empty(), "missing input: io error");
    expect(dc::exit_code(res.outcome) == 2, "io error exit code");
    if (sink) std::fclose(sink);
  }

  // large streaming input with small chunks
  {
    std::string in;
    const std::size_t n = 300000;
    in.reserve(n * 24);
    for (std::size_t i = 0; i < n; ++i) {
      in += std::to_string(i);
      in += (i % 1000 == 0) ? "\t\"dirty\tcell\"\tx\n" : "\tclean\tx\n";
    }
    dc::Dialect tab;
    Run r = run(in, tab, {}, 4096);
    expect(r.res.outcome == dc::Outcome::Ok && r.res.records == n, "large: all records");
    expect(r.audit.size() == n / 1000, "large: one entry per dirty record");
    expect(r.stats.bytes_in == in.size(), "large: bytes_in");
    expect(r.output.size() == in.size() - 2 * (n / 1000), "large: quotes dropped, sizes match");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] pipeline\n";
  return 0;
}
