#pragma once
#include "delim_cleanse/sanitize.hpp"
#include <array>
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dc {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t records = 0;
  std::uint64_t fields = 0;
  std::uint64_t bytes_in = 0;
  std::uint64_t bytes_out = 0;
  std::uint64_t repaired_fields = 0;
  std::array<std::uint64_t, 3> repairs_by_kind{};   // indexed by RepairKind
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;

  std::vector<StageTiming> stages;

  std::uint64_t repairs(RepairKind k) const noexcept {
    return repairs_by_kind[static_cast<std::size_t>(k)];
  }
};

class MetricsRegistry {
public:
  void add_record(std::size_t nfields) noexcept { ++records_; fields_ += nfields; }
  void set_bytes_in(std::uint64_t b) noexcept { bytes_in_ = b; }
  void set_bytes_out(std::uint64_t b) noexcept { bytes_out_ = b; }
  void add_repairs(const std::vector<RepairKind>& kinds) noexcept;

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t records_{0};
  std::uint64_t fields_{0};
  std::uint64_t bytes_in_{0};
  std::uint64_t bytes_out_{0};
  std::uint64_t repaired_fields_{0};
  std::array<std::uint64_t, 3> by_kind_{};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
