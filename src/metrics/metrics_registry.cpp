#include "fast_chunker/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace fc {

static unsigned bit_width(std::uint64_t v) {
  unsigned n = 0;
  while (v) { ++n; v >>= 1; }
  return n;
}

void MetricsRegistry::reset() {
  chunks_ = bytes_ = hard_splits_ = min_ = max_ = 0;
  buckets_.fill(0);
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::add_chunk(std::size_t len) noexcept {
  const auto n = static_cast<std::uint64_t>(len);
  min_ = chunks_ == 0 ? n : std::min(min_, n);
  max_ = std::max(max_, n);
  ++chunks_;
  bytes_ += n;
  ++buckets_[bit_width(n)];
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (stage_accum_ms_.find(key) == stage_accum_ms_.end()) {
    stage_order_.push_back(key);
    stage_accum_ms_[key] = 0.0;
  }
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  stage_accum_ms_[key] += std::chrono::duration<double, std::milli>(
                            std::chrono::steady_clock::now() - it->second).count();
  stage_starts_.erase(it);
}

ChunkStats MetricsRegistry::snapshot(double wall_ms) const {
  ChunkStats r;
  r.chunks = chunks_;
  r.bytes = bytes_;
  r.hard_splits = hard_splits_;
  r.min_chunk = min_;
  r.max_chunk = max_;
  r.mean_chunk = chunks_ ? static_cast<double>(bytes_) / static_cast<double>(chunks_) : 0.0;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0*1024.0)) / sec : 0.0;
  r.chunks_per_sec  = (sec > 0.0) ? chunks_ / sec : 0.0;

  r.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) r.stages.push_back(StageTiming{name, stage_accum_ms_.at(name)});

  for (std::size_t k = 0; k < buckets_.size(); ++k) {
    if (!buckets_[k]) continue;
    const std::uint64_t upper = (k == 0) ? 0 : (k >= 64 ? ~std::uint64_t(0) : (std::uint64_t(1) << k) - 1);
    r.size_histogram.emplace_back(upper, buckets_[k]);
  }
  return r;
}

}
