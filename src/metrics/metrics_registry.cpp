#include "json_table/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace jt {

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  if (stage_accum_us_.find(key) == stage_accum_us_.end()) stage_order_.push_back(key);
  stage_accum_us_[key] += static_cast<std::uint64_t>(us);
  stage_starts_.erase(it);
}

void MetricsRegistry::add_skips(std::string_view reason, std::uint64_t n) {
  if (n == 0) return;
  skips_[std::string(reason)] += n;
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.rows = rows_;
  r.bytes = bytes_;
  r.wall_time_ms = wall_ms;
  r.rows_per_sec = (wall_ms > 0.0) ? rows_ / (wall_ms / 1000.0) : 0.0;

  r.skips_by_reason = skips_;
  r.stages.reserve(stage_order_.size());
  for (auto& name : stage_order_) r.stages.push_back(StageTiming{name, stage_accum_us_.at(name)});
  return r;
}

}
