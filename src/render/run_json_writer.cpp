#include "delim_cleanse/run_json.hpp"
#include "delim_cleanse/path_utils.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <fstream>
#include <sstream>

namespace dc {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned char>(c));
          o << tmp;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  const RunStats& s = p.stats;
  std::ostringstream o;
  o << "{";
  o << "\"status\":"; esc(o, p.status); o << ",";
  o << "\"error\":";  esc(o, p.error);  o << ",";
  o << "\"records\":" << s.records << ",";
  o << "\"fields\":" << s.fields << ",";
  o << "\"bytes_in\":" << s.bytes_in << ",";
  o << "\"bytes_out\":" << s.bytes_out << ",";
  o << "\"repaired_fields\":" << s.repaired_fields << ",";
  o << "\"audit_entries\":" << p.audit_entries << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";

  o << "\"repairs_by_kind\":{";
  for (std::size_t i = 0; i < s.repairs_by_kind.size(); ++i) {
    if (i) o << ",";
    esc(o, to_string(static_cast<RepairKind>(i)));
    o << ":" << s.repairs_by_kind[i];
  }
  o << "},";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << s.stages[i].duration_ms << "}";
  }
  o << "],";

  o << "\"input\":";     esc(o, p.input);  o << ",";
  o << "\"output\":";    esc(o, p.output); o << ",";
  o << "\"delimiter\":"; esc(o, std::string(1, p.delimiter));

  o << "}";
  return o.str();
}

bool RunJsonWriter::write_file(const std::string& path, const RunJsonPayload& p,
                               std::string* err_out) {
  if (!ensure_parent_dirs(path)) {
    if (err_out) *err_out = "cannot create parent directories for " + path;
    return false;
  }
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "failed to open " + path;
    return false;
  }
  const std::string js = to_json(p);
  out.write(js.data(), static_cast<std::streamsize>(js.size()));
  out << '\n';
  if (!out) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

}
