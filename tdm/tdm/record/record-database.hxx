#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <odb/database.hxx>
#include <odb/transaction.hxx>
#include <odb/schema-catalog.hxx>
#include <odb/sqlite/database.hxx>

#include <boost/interprocess/sync/file_lock.hpp>

#include <tdm/record/record-query.hxx>
#include <tdm/record/record-types.hxx>

namespace tdm
{
  namespace fs = std::filesystem;

  template <typename S = std::string>
  struct record_database_traits
  {
    using string_type = S;
    using database_type = odb::sqlite::database;

    static constexpr const char* db_name = "tdm.db";

    // Name of the table we look for before creating the schema. Must match
    // the mapping.
    //
    static constexpr const char* table_name = "downloads";

    static constexpr bool auto_create = true;

    // Lock file next to the database. Only one process may hold it: the
    // registry of running transfers is per process, so a second one would
    // recover (and restart) the first one's downloads.
    //
    static constexpr const char* lock_name = "tdm.lock";

    // Transfer coroutines write progress while the service reads, so
    // readers must not block on the writer.
    //
    static constexpr bool wal = true;

    // Recovery relies on the statuses we wrote before a crash, so unlike a
    // cache we cannot run with synchronous=OFF. NORMAL is durable enough in
    // WAL mode.
    //
    static constexpr const char* synchronous = "NORMAL";
  };

  // Record store backed by an SQLite database.
  //
  // Every operation runs in its own transaction. ODB pools connections
  // internally so the store can be shared between the admission controller
  // and the transfer coroutines.
  //
  template <typename T = record_database_traits<>>
  class basic_record_database
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using database_type = typename traits_type::database_type;

    // Open (creating if necessary) the database in the data directory.
    // Throw std::runtime_error if the directory cannot be created or if
    // another process has the database open.
    //
    explicit
    basic_record_database (const fs::path& data_dir);

    basic_record_database (const basic_record_database&) = delete;
    basic_record_database& operator= (const basic_record_database&) = delete;

    bool
    open () const noexcept;

    const fs::path&
    path () const noexcept;

    database_type&
    db () noexcept;

    // Store contract.
    //

    // Persist a copy and return the assigned id. A zero created_at is set to
    // the current time.
    //
    record_id
    insert (const download_record&);

    std::optional<download_record>
    find (record_id) const;

    std::vector<download_record>
    list (const record_filter& = record_filter ()) const;

    bool
    update (record_id, const record_patch&);

    bool
    erase (record_id);

    std::size_t
    count (const record_filter& = record_filter ()) const;

    // Maintenance.
    //
    void
    vacuum ();

    // Run 'PRAGMA integrity_check'.
    //
    bool
    check () const;

  private:
    void
    init (const fs::path&);

    void
    schema ();

    void
    pragmas ();

    void
    lock (const fs::path&);

    fs::path path_;

    // Released after the database is closed.
    //
    boost::interprocess::file_lock lock_;
    std::unique_ptr<database_type> db_;
  };

  using record_database = basic_record_database<>;
}

#include <tdm/record/record-database.ixx>
#include <tdm/record/record-database.txx>
