#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include <tdm/record/record-query.hxx>
#include <tdm/record/record-types.hxx>

namespace tdm
{
  // Record store kept in process memory.
  //
  // Same contract as the database store, used by the tests and by runs that
  // do not want anything on disk. Every member function is safe to call from
  // multiple threads.
  //
  class memory_record_store
  {
  public:
    memory_record_store () = default;

    memory_record_store (const memory_record_store&) = delete;
    memory_record_store& operator= (const memory_record_store&) = delete;

    // Assign the next id and store a copy. A zero created_at is set to the
    // current time.
    //
    record_id
    insert (const download_record&);

    std::optional<download_record>
    find (record_id) const;

    std::vector<download_record>
    list (const record_filter& = record_filter ()) const;

    // Return false if there is no such record.
    //
    bool
    update (record_id, const record_patch&);

    bool
    erase (record_id);

    std::size_t
    count (const record_filter& = record_filter ()) const;

  private:
    mutable std::mutex mutex_;
    std::map<record_id, download_record> records_;
    record_id next_ {1};
  };
}
