#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <tdm/record/record-types.hxx>

namespace tdm
{
  enum class record_order
  {
    oldest_first, // By created_at, then id.
    newest_first
  };

  // Selection over the record store. Empty members do not constrain.
  //
  struct record_filter
  {
    std::set<download_status> statuses;
    std::optional<download_origin> origin;
    std::optional<content_identity> identity;

    record_order order {record_order::oldest_first};
    std::size_t limit {0}; // 0 means unlimited.

    record_filter () = default;

    record_filter (std::initializer_list<download_status> s)
      : statuses (s)
    {
    }

    bool
    matches (const download_record&) const;
  };

  // Partial update. Only the engaged members are written; updated_at is
  // always refreshed.
  //
  struct record_patch
  {
    std::optional<download_status> status;
    std::optional<std::int32_t> priority;
    std::optional<double> progress_percent;
    std::optional<double> throughput_bps;
    std::optional<std::uint64_t> size_bytes;
    std::optional<std::string> target_path;
    std::optional<std::string> error;
    std::optional<std::int64_t> started_at;

    void
    apply (download_record&) const;
  };

  // Queue order: higher priority first, then earlier created_at, then lower
  // id.
  //
  bool
  queue_before (const download_record&, const download_record&);

  // Sort by the filter's order and truncate to its limit.
  //
  void
  arrange (std::vector<download_record>&, const record_filter&);
}
