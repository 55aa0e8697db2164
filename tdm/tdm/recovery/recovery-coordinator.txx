#include <algorithm>
#include <optional>
#include <vector>

#include <tdm/record/record-query.hxx>

namespace tdm
{
  template <typename T>
  basic_recovery_coordinator<T>::
  basic_recovery_coordinator (store_type& s,
                              controller_type& c,
                              cancel_registry& r,
                              restore_function f)
    : store_ (s),
      controller_ (c),
      registry_ (r),
      restore_ (std::move (f))
  {
  }

  template <typename T>
  recovery_report basic_recovery_coordinator<T>::
  recover ()
  {
    recovery_report rep;

    std::vector<download_record> rs (
      store_.list (record_filter {download_status::downloading,
                                  download_status::queued,
                                  download_status::pending}));

    for (const download_record& r: rs)
    {
      if (r.status () == download_status::queued ||
          registry_.contains (r.id ()))
        continue;

      record_patch p;
      p.status = download_status::queued;
      p.throughput_bps = 0.0;

      if (store_.update (r.id (), p))
        ++rep.reset;
    }

    std::vector<download_record> qs (
      store_.list (record_filter {download_status::queued}));

    std::sort (qs.begin (), qs.end (), &queue_before);

    std::size_t i (0);
    for (; i != qs.size (); ++i)
    {
      const download_record& r (qs[i]);

      if (!controller_.try_admit (r.id ()))
        break;

      std::optional<download_record> a (store_.find (r.id ()));

      if (a && restore_ (*a))
        ++rep.admitted;
    }

    rep.queued = qs.size () - i;
    return rep;
  }
}
