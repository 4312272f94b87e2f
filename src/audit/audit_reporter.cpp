#include "delim_cleanse/audit.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <string>
#include <utility>

namespace dc {

std::string join_kinds(const std::vector<RepairKind>& kinds) {
  std::string out;
  for (std::size_t i = 0; i < kinds.size(); ++i) {
    if (i) out += ", ";
    out += to_string(kinds[i]);
  }
  return out;
}

AuditReporter::AuditReporter(std::shared_ptr<spdlog::logger> logger, Format fmt)
  : log_(std::move(logger)), fmt_(fmt) {}

void AuditReporter::report(std::uint64_t record_number, std::uint64_t field_number,
                           const std::vector<RepairKind>& kinds) {
  if (kinds.empty()) return;
  ++entries_;
  if (fmt_ == Format::Json) {
    std::string repairs;
    for (std::size_t i = 0; i < kinds.size(); ++i) {
      if (i) repairs += ',';
      repairs += '"';
      repairs += to_string(kinds[i]);
      repairs += '"';
    }
    log_->info("{{\"record\":{},\"field\":{},\"repairs\":[{}]}}",
               record_number, field_number, repairs);
    return;
  }
  log_->info("Record number {}, field number {}: [{}]",
             record_number, field_number, join_kinds(kinds));
}

bool parse_audit_format(const std::string& s, AuditReporter::Format* out) {
  if (s == "text") { *out = AuditReporter::Format::Text; return true; }
  if (s == "json") { *out = AuditReporter::Format::Json; return true; }
  return false;
}

std::shared_ptr<spdlog::logger> make_logger(const LogConfig& cfg, std::string* err_out) {
  try {
    spdlog::sink_ptr sink;
    if (!cfg.file.empty()) {
      sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, /*truncate=*/true);
    } else if (cfg.color) {
      sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
      sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    }

    spdlog::drop(cfg.name);
    auto log = std::make_shared<spdlog::logger>(cfg.name, std::move(sink));
    log->set_pattern(kLogPattern);
    log->set_level(spdlog::level::info);
    spdlog::register_logger(log);
    spdlog::cfg::load_env_levels();   // SPDLOG_LEVEL, e.g. "warn" or "cleanse=off"

    if (!cfg.level.empty()) {
      auto lvl = spdlog::level::from_str(cfg.level);
      if (lvl == spdlog::level::off && cfg.level != "off") {
        if (err_out) *err_out = "unknown log level: " + cfg.level;
        spdlog::drop(cfg.name);
        return nullptr;
      }
      log->set_level(lvl);
    }
    log->flush_on(spdlog::level::warn);
    return log;
  } catch (const spdlog::spdlog_ex& e) {
    if (err_out) *err_out = e.what();
    return nullptr;
  }
}

}
