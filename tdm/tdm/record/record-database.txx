#include <fstream>
#include <stdexcept>
#include <system_error>

#include <odb/query.hxx>
#include <odb/result.hxx>
#include <odb/sqlite/connection.hxx>

#include <sqlite3.h>

// Generated by the ODB compiler from record-types.hxx and the mapping.
//
#include <tdm/record/record-types-odb.hxx>

namespace tdm
{
  template <typename T>
  basic_record_database<T>::
  basic_record_database (const fs::path& d)
  {
    init (d);
  }

  template <typename T>
  void basic_record_database<T>::
  init (const fs::path& d)
  {
    if (!fs::exists (d))
    {
      std::error_code ec;
      fs::create_directories (d, ec);

      if (ec)
        throw std::runtime_error (
          "failed to create data directory: " + d.string () +
          ": " + ec.message ());
    }

    lock (d / traits_type::lock_name);

    path_ = d / traits_type::db_name;

    bool create (!fs::exists (path_));

    db_ = std::make_unique<database_type> (
      path_.string (),
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    pragmas ();

    if (create || traits_type::auto_create)
      schema ();
  }

  template <typename T>
  void basic_record_database<T>::
  lock (const fs::path& p)
  {
    // file_lock needs an existing file.
    //
    {
      std::ofstream o (p, std::ios::app);

      if (!o)
        throw std::runtime_error ("unable to create lock file " + p.string ());
    }

    lock_ = boost::interprocess::file_lock (p.string ().c_str ());

    if (!lock_.try_lock ())
      throw std::runtime_error (
        "database in " + p.parent_path ().string () +
        " is in use by another tdm process");
  }

  template <typename T>
  void basic_record_database<T>::
  schema ()
  {
    // create_schema() fails if the table is already there, so peek at
    // sqlite_master first.
    //
    bool exists (false);
    {
      odb::transaction t (db_->begin ());

      odb::sqlite::connection& c (
        static_cast<odb::sqlite::connection&> (t.connection ()));

      sqlite3_stmt* s (nullptr);
      const char* q (
        "SELECT name FROM sqlite_master WHERE type='table' AND name=?");

      if (sqlite3_prepare_v2 (c.handle (), q, -1, &s, nullptr) == SQLITE_OK)
      {
        sqlite3_bind_text (s, 1, traits_type::table_name, -1, SQLITE_STATIC);

        if (sqlite3_step (s) == SQLITE_ROW)
          exists = true;

        sqlite3_finalize (s);
      }

      t.commit ();
    }

    if (!exists)
    {
      odb::transaction t (db_->begin ());
      odb::schema_catalog::create_schema (*db_);
      t.commit ();
    }
  }

  template <typename T>
  void basic_record_database<T>::
  pragmas ()
  {
    // WAL and synchronous cannot be changed inside a transaction, which
    // ODB's execute() would start for us.
    //
    odb::connection_ptr c (db_->connection ());
    odb::sqlite::connection& sc (
      static_cast<odb::sqlite::connection&> (*c));
    sqlite3* h (sc.handle ());

    if (traits_type::wal)
      sqlite3_exec (h, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);

    std::string s ("PRAGMA synchronous=");
    s += traits_type::synchronous;

    sqlite3_exec (h, s.c_str (), nullptr, nullptr, nullptr);
    sqlite3_exec (h, "PRAGMA temp_store=MEMORY", nullptr, nullptr, nullptr);
  }

  template <typename T>
  record_id basic_record_database<T>::
  insert (const download_record& r)
  {
    download_record n (r);

    if (n.created_at () == 0)
      n.set_created_at (current_timestamp_us ());

    n.set_updated_at (n.created_at ());

    odb::transaction t (db_->begin ());
    record_id id (db_->persist (n));
    t.commit ();

    return id;
  }

  template <typename T>
  std::optional<download_record> basic_record_database<T>::
  find (record_id id) const
  {
    odb::transaction t (db_->begin ());
    std::shared_ptr<download_record> r (
      db_->template find<download_record> (id));
    t.commit ();

    return r ? std::optional<download_record> (*r) : std::nullopt;
  }

  template <typename T>
  std::vector<download_record> basic_record_database<T>::
  list (const record_filter& f) const
  {
    using query = odb::query<download_record>;

    query q (true);

    if (!f.statuses.empty ())
      q = q && query::status.in_range (f.statuses.begin (),
                                       f.statuses.end ());

    if (f.origin)
      q = q && query::origin == *f.origin;

    if (f.identity)
      q = q &&
          query::file_id == f.identity->file_id &&
          query::access_token == f.identity->access_token;

    std::string d (f.order == record_order::newest_first ? "DESC" : "ASC");
    q = q + "ORDER BY" + query::created_at + d + "," + query::id + d;

    std::vector<download_record> r;

    odb::transaction t (db_->begin ());
    odb::result<download_record> res (
      db_->template query<download_record> (q));

    for (auto& x: res)
    {
      if (f.limit != 0 && r.size () == f.limit)
        break;

      r.push_back (x);
    }

    t.commit ();
    return r;
  }

  template <typename T>
  bool basic_record_database<T>::
  update (record_id id, const record_patch& p)
  {
    odb::transaction t (db_->begin ());

    std::shared_ptr<download_record> r (
      db_->template find<download_record> (id));

    if (r == nullptr)
    {
      t.commit ();
      return false;
    }

    p.apply (*r);
    db_->update (*r);

    t.commit ();
    return true;
  }

  template <typename T>
  bool basic_record_database<T>::
  erase (record_id id)
  {
    using query = odb::query<download_record>;

    odb::transaction t (db_->begin ());
    unsigned long long n (
      db_->template erase_query<download_record> (query::id == id));
    t.commit ();

    return n != 0;
  }

  template <typename T>
  std::size_t basic_record_database<T>::
  count (const record_filter& f) const
  {
    record_filter u (f);
    u.limit = 0;

    return list (u).size ();
  }

  template <typename T>
  void basic_record_database<T>::
  vacuum ()
  {
    // VACUUM can't run inside a transaction.
    //
    odb::connection_ptr c (db_->connection ());
    c->execute ("VACUUM");
  }

  template <typename T>
  bool basic_record_database<T>::
  check () const
  {
    odb::transaction t (db_->begin ());
    bool ok (true);

    odb::sqlite::connection& c (
      static_cast<odb::sqlite::connection&> (t.connection ()));

    sqlite3_stmt* s (nullptr);
    const char* q ("PRAGMA integrity_check");

    if (sqlite3_prepare_v2 (c.handle (), q, -1, &s, nullptr) == SQLITE_OK)
    {
      if (sqlite3_step (s) == SQLITE_ROW)
      {
        const char* r (
          reinterpret_cast<const char*> (sqlite3_column_text (s, 0)));

        if (r == nullptr || std::string (r) != "ok")
          ok = false;
      }
      sqlite3_finalize (s);
    }
    else
      ok = false;

    t.commit ();
    return ok;
  }
}
