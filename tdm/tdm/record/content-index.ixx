namespace tdm
{
  template <typename S>
  inline std::optional<download_record> basic_content_index<S>::
  find_completed (const std::string& file_id,
                  const std::string& access_token) const
  {
    return find_completed (content_identity (file_id, access_token));
  }

  template <typename S>
  inline std::optional<download_record> basic_content_index<S>::
  find_completed (const content_identity& c) const
  {
    if (c.empty ())
      return std::nullopt;

    record_filter f {download_status::completed};
    f.identity = c;
    f.limit = 1;

    auto r (store_.list (f));
    return r.empty () ? std::nullopt : std::optional<download_record> (r[0]);
  }
}
