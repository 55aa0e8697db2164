#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>

#include <tdm/progress/progress-types.hxx>

namespace tdm
{
  template <typename S = std::string,
            typename C = std::chrono::steady_clock>
  struct progress_tracker_traits
  {
    using string_type = S;
    using clock_type = C;
    using time_point = typename clock_type::time_point;
    using duration = typename clock_type::duration;

    // Minimum time between two outward notifications. Samples in between
    // are still persisted.
    //
    static constexpr int notify_interval_ms = 2000;

    // Lower bound of the elapsed time in seconds so that two reports in the
    // same clock tick do not divide by zero.
    //
    static constexpr double epsilon = 1e-3;

    static string_type
    format_bytes (std::uint64_t bytes);

    static string_type
    format_speed (double bytes_per_sec);

    static string_type
    format_duration (std::int64_t seconds);
  };

  // Per-transfer progress arithmetic.
  //
  // Not thread-safe: each transfer owns its tracker and reports from its own
  // coroutine. Time is passed in explicitly so the callers decide the clock.
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_tracker
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using clock_type = typename traits_type::clock_type;
    using time_point = typename traits_type::time_point;
    using duration = typename traits_type::duration;

    explicit
    basic_progress_tracker (
      time_point start,
      duration interval =
        std::chrono::milliseconds (traits_type::notify_interval_ms));

    // Record a new byte count and return the resulting sample.
    //
    progress_sample
    update (std::uint64_t bytes, std::uint64_t total, time_point now);

    // Return true if an outward notification is due and, if so, start a new
    // interval. The first call always returns true.
    //
    bool
    notify_due (time_point now);

    // Average throughput over the whole transfer.
    //
    double
    average_throughput (std::uint64_t total, time_point now) const;

    const progress_sample&
    last () const noexcept
    {
      return last_;
    }

    time_point
    start () const noexcept
    {
      return start_;
    }

  private:
    static double
    seconds (duration d)
    {
      return std::chrono::duration<double> (d).count ();
    }

    time_point start_;
    duration interval_;

    time_point prev_time_;
    std::uint64_t prev_bytes_ {0};

    bool notified_ {false};
    time_point last_notify_;

    progress_sample last_;
  };

  using progress_tracker = basic_progress_tracker<>;
}

#include <tdm/progress/progress-tracker.ixx>
#include <tdm/progress/progress-tracker.txx>
