#pragma once

#include <optional>
#include <string>

#include <tdm/record/record-query.hxx>
#include <tdm/record/record-types.hxx>

namespace tdm
{
  // Lookup of previously completed downloads by content identity.
  //
  // Only completed records count: a failed, cancelled or paused attempt at
  // the same content does not prevent a new one.
  //
  template <typename S>
  class basic_content_index
  {
  public:
    using store_type = S;

    explicit
    basic_content_index (store_type& s)
      : store_ (s)
    {
    }

    std::optional<download_record>
    find_completed (const std::string& file_id,
                    const std::string& access_token) const;

    std::optional<download_record>
    find_completed (const content_identity&) const;

  private:
    store_type& store_;
  };
}

#include <tdm/record/content-index.ixx>
