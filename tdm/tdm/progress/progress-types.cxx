#include <tdm/progress/progress-types.hxx>

#include <algorithm>

namespace tdm
{
  double
  compute_percent (std::uint64_t bytes, std::uint64_t total) noexcept
  {
    if (total == 0)
      return 0.0;

    return std::min (100.0,
                     static_cast<double> (bytes) /
                     static_cast<double> (total) * 100.0);
  }

  double
  compute_throughput (std::uint64_t bytes,
                      std::uint64_t prev_bytes,
                      double elapsed,
                      double epsilon) noexcept
  {
    if (bytes <= prev_bytes)
      return 0.0;

    return static_cast<double> (bytes - prev_bytes) /
           std::max (elapsed, epsilon);
  }
}
