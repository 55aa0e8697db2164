#include <tdm/record/record-query.hxx>

#include <algorithm>

using namespace std;

namespace tdm
{
  bool record_filter::
  matches (const download_record& r) const
  {
    if (!statuses.empty () && statuses.find (r.status ()) == statuses.end ())
      return false;

    if (origin && *origin != r.origin ())
      return false;

    if (identity)
    {
      optional<content_identity> i (r.identity ());
      if (!i || !(*i == *identity))
        return false;
    }

    return true;
  }

  void record_patch::
  apply (download_record& r) const
  {
    if (status)           r.set_status (*status);
    if (priority)         r.set_priority (*priority);
    if (progress_percent) r.set_progress_percent (*progress_percent);
    if (throughput_bps)   r.set_throughput_bps (*throughput_bps);
    if (size_bytes)       r.set_size_bytes (*size_bytes);
    if (target_path)      r.set_target_path (*target_path);
    if (error)            r.set_error (*error);
    if (started_at)       r.set_started_at (*started_at);

    r.set_updated_at (current_timestamp_us ());
  }

  bool
  queue_before (const download_record& x, const download_record& y)
  {
    if (x.priority () != y.priority ())
      return x.priority () > y.priority ();

    if (x.created_at () != y.created_at ())
      return x.created_at () < y.created_at ();

    return x.id () < y.id ();
  }

  void
  arrange (vector<download_record>& rs, const record_filter& f)
  {
    auto older ([] (const download_record& x, const download_record& y)
    {
      return x.created_at () != y.created_at ()
        ? x.created_at () < y.created_at ()
        : x.id () < y.id ();
    });

    if (f.order == record_order::oldest_first)
      sort (rs.begin (), rs.end (), older);
    else
      sort (rs.begin (), rs.end (),
            [&older] (const download_record& x, const download_record& y)
            {
              return older (y, x);
            });

    if (f.limit != 0 && rs.size () > f.limit)
      rs.resize (f.limit);
  }
}
