#include <algorithm>
#include <iostream>

namespace tdm
{
  template <typename T>
  basic_admission_controller<T>::
  basic_admission_controller (store_type& s,
                              cancel_registry& r,
                              std::size_t max,
                              victim_policy p)
    : store_ (s),
      registry_ (r),
      max_ (max),
      policy_ (p)
  {
  }

  template <typename T>
  std::size_t basic_admission_controller<T>::
  downloading () const
  {
    return store_.count (record_filter {download_status::downloading});
  }

  template <typename T>
  void basic_admission_controller<T>::
  promote (record_id id)
  {
    record_patch p;
    p.status = download_status::downloading;
    p.started_at = current_timestamp_us ();
    p.error = std::string ();

    store_.update (id, p);
  }

  template <typename T>
  bool basic_admission_controller<T>::
  try_admit (record_id id)
  {
    std::lock_guard<std::mutex> l (mutex_);

    std::optional<download_record> r (store_.find (id));

    if (!r || r->status () == download_status::downloading)
      return false;

    if (downloading () < max_)
    {
      promote (id);
      return true;
    }

    if (r->status () != download_status::queued)
    {
      record_patch p;
      p.status = download_status::queued;
      store_.update (id, p);
    }

    return false;
  }

  template <typename T>
  std::size_t basic_admission_controller<T>::
  on_finished (record_id)
  {
    std::vector<record_id> ps;
    {
      std::lock_guard<std::mutex> l (mutex_);

      for (std::size_t n (downloading ()); n < max_; ++n)
      {
        std::vector<download_record> qs (
          store_.list (record_filter {download_status::queued}));

        if (qs.empty ())
          break;

        // The queue is small, a linear scan is all we need.
        //
        auto i (std::min_element (qs.begin (), qs.end (), &queue_before));

        promote (i->id ());
        ps.push_back (i->id ());
      }
    }

    // Dispatch outside of the lock: starting a transfer may finish it
    // synchronously and call back into us.
    //
    std::size_t n (0);
    for (record_id id: ps)
    {
      std::optional<download_record> r (store_.find (id));

      if (!r)
        continue;

      if (dispatch_)
        dispatch_ (*r);
      else
        std::cerr << "warning: no dispatcher for promoted download "
                  << id << std::endl;

      ++n;
    }

    return n;
  }

  template <typename T>
  bool basic_admission_controller<T>::
  withdraw (record_id id, download_status s, const std::string& reason)
  {
    std::lock_guard<std::mutex> l (mutex_);

    std::optional<download_record> r (store_.find (id));

    if (!r || (r->status () != download_status::queued &&
               r->status () != download_status::pending))
      return false;

    record_patch p;
    p.status = s;
    p.error = reason;
    p.progress_percent = 0.0;
    p.throughput_bps = 0.0;

    return store_.update (id, p);
  }

  template <typename T>
  std::optional<record_id> basic_admission_controller<T>::
  preempt (record_id favored)
  {
    std::optional<record_id> v;
    {
      std::lock_guard<std::mutex> l (mutex_);

      if (store_.count (record_filter {download_status::queued}) == 0)
        return std::nullopt;

      std::vector<download_record> rs (
        store_.list (record_filter {download_status::downloading}));

      rs.erase (std::remove_if (rs.begin (), rs.end (),
                                [favored] (const download_record& r)
                                {
                                  return r.id () == favored;
                                }),
                rs.end ());

      if (rs.empty ())
        return std::nullopt;

      auto older ([] (const download_record& x, const download_record& y)
      {
        if (x.started_at () != y.started_at ())
          return x.started_at () < y.started_at ();

        if (x.created_at () != y.created_at ())
          return x.created_at () < y.created_at ();

        return x.id () < y.id ();
      });

      auto i (policy_ == victim_policy::lowest_priority
              ? std::min_element (rs.begin (), rs.end (),
                                  [&older] (const download_record& x,
                                            const download_record& y)
                                  {
                                    return x.priority () != y.priority ()
                                      ? x.priority () < y.priority ()
                                      : older (x, y);
                                  })
              : std::min_element (rs.begin (), rs.end (), older));

      v = i->id ();
    }

    // The victim's exit path marks it paused and calls on_finished(), which
    // hands the slot to the best queued record.
    //
    if (!registry_.request_cancel (*v, cancel_reason::preempt))
    {
      // Downloading without a live transfer, so no exit path will run. Park
      // it ourselves unless it has finished in the meantime.
      //
      {
        std::lock_guard<std::mutex> l (mutex_);

        std::optional<download_record> r (store_.find (*v));
        if (!r || r->status () != download_status::downloading)
          return v;

        record_patch p;
        p.status = download_status::paused;
        p.error = to_string (cancel_reason::preempt);
        store_.update (*v, p);
      }

      on_finished (*v);
    }

    return v;
  }

  template <typename T>
  std::size_t basic_admission_controller<T>::
  active_count () const
  {
    std::lock_guard<std::mutex> l (mutex_);
    return downloading ();
  }
}
