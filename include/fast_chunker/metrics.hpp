#pragma once
#include <array>
#include <cstdint>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fc {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct ChunkStats {
  std::uint64_t chunks = 0;
  std::uint64_t bytes = 0;
  std::uint64_t hard_splits = 0;
  std::uint64_t min_chunk = 0;
  std::uint64_t max_chunk = 0;
  double mean_chunk = 0.0;
  double throughput_mb_s = 0.0;
  double chunks_per_sec = 0.0;

  std::vector<StageTiming> stages;
  // (inclusive upper bound of a power-of-two bucket, count); empty buckets omitted
  std::vector<std::pair<std::uint64_t, std::uint64_t>> size_histogram;
};

class MetricsRegistry {
public:
  void reset();
  void add_chunk(std::size_t len) noexcept;
  void add_hard_splits(std::uint64_t n) noexcept { hard_splits_ += n; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  // Throughput figures use `wall_ms` of the chunking stage.
  ChunkStats snapshot(double wall_ms) const;

  std::uint64_t chunks() const noexcept { return chunks_; }
  std::uint64_t bytes() const noexcept { return bytes_; }

private:
  std::uint64_t chunks_{0};
  std::uint64_t bytes_{0};
  std::uint64_t hard_splits_{0};
  std::uint64_t min_{0};
  std::uint64_t max_{0};
  std::array<std::uint64_t, 65> buckets_{};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
