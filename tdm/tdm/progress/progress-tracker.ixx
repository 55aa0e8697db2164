namespace tdm
{
  template <typename T>
  inline basic_progress_tracker<T>::
  basic_progress_tracker (time_point s, duration i)
    : start_ (s),
      interval_ (i),
      prev_time_ (s),
      last_notify_ (s)
  {
  }

  template <typename T>
  inline double basic_progress_tracker<T>::
  average_throughput (std::uint64_t total, time_point now) const
  {
    return static_cast<double> (total) /
           std::max (seconds (now - start_), traits_type::epsilon);
  }
}
