#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tdm
{
  template <typename S, typename C>
  S progress_tracker_traits<S, C>::
  format_bytes (std::uint64_t n)
  {
    std::ostringstream o;

    if (n < 1024)
    {
      o << n << " B";
    }
    else if (n < 1024 * 1024)
    {
      o << std::fixed << std::setprecision (1)
        << (n / 1024.0) << " KiB";
    }
    else if (n < 1024 * 1024 * 1024)
    {
      o << std::fixed << std::setprecision (1)
        << (n / (1024.0 * 1024.0)) << " MiB";
    }
    else
    {
      o << std::fixed << std::setprecision (1)
        << (n / (1024.0 * 1024.0 * 1024.0)) << " GiB";
    }

    return o.str ();
  }

  template <typename S, typename C>
  S progress_tracker_traits<S, C>::
  format_speed (double bps)
  {
    std::ostringstream o;

    if (bps < 1024)
    {
      o << std::fixed << std::setprecision (0)
        << bps << " B/s";
    }
    else if (bps < 1024 * 1024)
    {
      o << std::fixed << std::setprecision (1)
        << (bps / 1024.0) << " KiB/s";
    }
    else if (bps < 1024 * 1024 * 1024)
    {
      o << std::fixed << std::setprecision (1)
        << (bps / (1024.0 * 1024.0)) << " MiB/s";
    }
    else
    {
      o << std::fixed << std::setprecision (1)
        << (bps / (1024.0 * 1024.0 * 1024.0)) << " GiB/s";
    }

    return o.str ();
  }

  template <typename S, typename C>
  S progress_tracker_traits<S, C>::
  format_duration (std::int64_t s)
  {
    std::ostringstream o;

    std::int64_t h (s / 3600);
    std::int64_t m ((s % 3600) / 60);
    s %= 60;

    if (h > 0)
      o << h << "h " << m << "m";
    else if (m > 0)
      o << m << "m " << s << "s";
    else
      o << s << "s";

    return o.str ();
  }

  template <typename T>
  progress_sample basic_progress_tracker<T>::
  update (std::uint64_t bytes, std::uint64_t total, time_point now)
  {
    progress_sample s;
    s.bytes = bytes;
    s.total_bytes = total;
    s.percent = compute_percent (bytes, total);
    s.throughput_bps = compute_throughput (bytes,
                                           prev_bytes_,
                                           seconds (now - prev_time_),
                                           traits_type::epsilon);

    prev_bytes_ = bytes;
    prev_time_ = now;
    last_ = s;

    return s;
  }

  template <typename T>
  bool basic_progress_tracker<T>::
  notify_due (time_point now)
  {
    if (notified_ && now - last_notify_ < interval_)
      return false;

    notified_ = true;
    last_notify_ = now;
    return true;
  }
}
