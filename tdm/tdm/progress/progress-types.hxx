#pragma once

#include <cstdint>

namespace tdm
{
  // One observation of a running transfer.
  //
  struct progress_sample
  {
    std::uint64_t bytes {0};
    std::uint64_t total_bytes {0}; // 0 if unknown.
    double percent {0.0};
    double throughput_bps {0.0};
  };

  // Percentage of total, 0 when the total is unknown. Clamped to 100 since
  // the transport may report more bytes than it announced.
  //
  double
  compute_percent (std::uint64_t bytes, std::uint64_t total) noexcept;

  // Bytes per second between two observations. A decrease in the byte count
  // (restarted transfer) yields 0.
  //
  double
  compute_throughput (std::uint64_t bytes,
                      std::uint64_t prev_bytes,
                      double elapsed_seconds,
                      double epsilon) noexcept;
}
