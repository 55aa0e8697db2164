#include <tdm/record/record-memory.hxx>

using namespace std;

namespace tdm
{
  record_id memory_record_store::
  insert (const download_record& r)
  {
    lock_guard<mutex> l (mutex_);

    download_record n (r);
    n.id_ = next_++;

    if (n.created_at_ == 0)
      n.created_at_ = current_timestamp_us ();

    n.updated_at_ = n.created_at_;

    records_.emplace (n.id_, n);
    return n.id_;
  }

  optional<download_record> memory_record_store::
  find (record_id id) const
  {
    lock_guard<mutex> l (mutex_);

    auto i (records_.find (id));
    return i != records_.end ()
      ? optional<download_record> (i->second)
      : nullopt;
  }

  vector<download_record> memory_record_store::
  list (const record_filter& f) const
  {
    vector<download_record> r;
    {
      lock_guard<mutex> l (mutex_);

      for (const auto& p: records_)
        if (f.matches (p.second))
          r.push_back (p.second);
    }

    arrange (r, f);
    return r;
  }

  bool memory_record_store::
  update (record_id id, const record_patch& p)
  {
    lock_guard<mutex> l (mutex_);

    auto i (records_.find (id));
    if (i == records_.end ())
      return false;

    p.apply (i->second);
    return true;
  }

  bool memory_record_store::
  erase (record_id id)
  {
    lock_guard<mutex> l (mutex_);
    return records_.erase (id) != 0;
  }

  size_t memory_record_store::
  count (const record_filter& f) const
  {
    lock_guard<mutex> l (mutex_);

    size_t n (0);
    for (const auto& p: records_)
      if (f.matches (p.second))
        ++n;

    return n;
  }
}
