#include <tdm/record/content-index.hxx>
#include <tdm/record/record-database.hxx>

#include <cassert>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace std;
using namespace tdm;

namespace fs = std::filesystem;

static fs::path
scratch (const string& n)
{
  fs::path d (fs::temp_directory_path () / ("tdm-record-database-" + n));

  // Wipe the slate clean in case a previous run crashed.
  //
  fs::remove_all (d);
  return d;
}

static void
test_open ()
{
  fs::path d (scratch ("open"));

  record_database db (d / "nested");

  assert (db.open ());
  assert (fs::exists (db.path ()));
  assert (db.path ().filename () == "tdm.db");
  assert (db.check ());
  assert (db.count () == 0);

  fs::remove_all (d);
}

static void
test_store ()
{
  fs::path d (scratch ("store"));
  record_database db (d);

  download_record r (download_origin::rule,
                     origin_ref (-100123, 42, 7),
                     "a.bin",
                     1024,
                     3);
  r.set_identity (content_identity ("F", "T"));

  record_id a (db.insert (r));
  assert (a != 0);

  optional<download_record> f (db.find (a));
  assert (f);
  assert (f->id () == a);
  assert (f->origin () == download_origin::rule);
  assert (f->ref () == origin_ref (-100123, 42, 7));
  assert (f->identity () && *f->identity () == content_identity ("F", "T"));
  assert (f->size_bytes () == 1024);
  assert (f->priority () == 3);
  assert (f->status () == download_status::pending);
  assert (f->created_at () != 0);

  record_patch p;
  p.status = download_status::downloading;
  p.progress_percent = 50.0;
  p.started_at = 123;

  assert (db.update (a, p));
  assert (!db.update (a + 1, p));

  f = db.find (a);
  assert (f->status () == download_status::downloading);
  assert (f->progress_percent () == 50.0);
  assert (f->started_at () == 123);

  assert (db.erase (a));
  assert (!db.erase (a));
  assert (!db.find (a));

  fs::remove_all (d);
}

static void
test_list ()
{
  fs::path d (scratch ("list"));
  record_database db (d);

  vector<record_id> ids;
  for (int64_t t: {100, 300, 200})
  {
    download_record r (download_origin::direct, origin_ref (1, t), "f");
    r.set_created_at (t);
    ids.push_back (db.insert (r));
  }

  record_patch p;
  p.status = download_status::queued;
  db.update (ids[2], p);

  vector<download_record> rs (db.list ());
  assert (rs.size () == 3);
  assert (rs[0].id () == ids[0]);
  assert (rs[1].id () == ids[2]);
  assert (rs[2].id () == ids[1]);

  record_filter f;
  f.order = record_order::newest_first;
  f.limit = 2;

  rs = db.list (f);
  assert (rs.size () == 2);
  assert (rs[0].id () == ids[1] && rs[1].id () == ids[2]);

  rs = db.list (record_filter {download_status::queued,
                               download_status::downloading});
  assert (rs.size () == 1 && rs[0].id () == ids[2]);

  assert (db.count (record_filter {download_status::pending}) == 2);

  fs::remove_all (d);
}

// Records written by one process must be there for the next one.
//
static void
test_reopen ()
{
  fs::path d (scratch ("reopen"));
  record_id a;
  {
    record_database db (d);
    download_record r (download_origin::direct, origin_ref (1, 2), "f");
    r.set_identity (content_identity ("F", "T"));
    a = db.insert (r);

    record_patch p;
    p.status = download_status::completed;
    db.update (a, p);
  }

  record_database db (d);
  assert (db.count () == 1);

  basic_content_index<record_database> x (db);
  optional<download_record> r (x.find_completed ("F", "T"));
  assert (r && r->id () == a);

  db.vacuum ();
  assert (db.check ());

  fs::remove_all (d);
}

// While one process has the database open, another one may not.
//
static void
test_single_instance ()
{
  fs::path d (scratch ("single"));
  {
    record_database db (d);
    assert (fs::exists (d / "tdm.lock"));

    pid_t p (fork ());
    assert (p != -1);

    if (p == 0)
    {
      try
      {
        record_database other (d);
        _exit (0);
      }
      catch (const runtime_error& e)
      {
        _exit (string (e.what ()).find ("in use") != string::npos ? 1 : 2);
      }
    }

    int s (0);
    assert (waitpid (p, &s, 0) == p);
    assert (WIFEXITED (s) && WEXITSTATUS (s) == 1);
  }

  // Released on close.
  //
  pid_t p (fork ());
  assert (p != -1);

  if (p == 0)
  {
    try
    {
      record_database db (d);
      _exit (db.open () ? 0 : 2);
    }
    catch (const runtime_error&)
    {
      _exit (1);
    }
  }

  int s (0);
  assert (waitpid (p, &s, 0) == p);
  assert (WIFEXITED (s) && WEXITSTATUS (s) == 0);

  fs::remove_all (d);
}

int
main ()
{
  test_open ();
  test_store ();
  test_list ();
  test_reopen ();
  test_single_instance ();
}
