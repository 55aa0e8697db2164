namespace tdm
{
  template <typename T>
  bool basic_record_database<T>::
  open () const noexcept
  {
    return db_ != nullptr;
  }

  template <typename T>
  const fs::path& basic_record_database<T>::
  path () const noexcept
  {
    return path_;
  }

  template <typename T>
  typename basic_record_database<T>::database_type&
  basic_record_database<T>::
  db () noexcept
  {
    return *db_;
  }
}
