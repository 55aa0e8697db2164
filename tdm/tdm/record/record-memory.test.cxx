#include <tdm/record/content-index.hxx>
#include <tdm/record/record-memory.hxx>

#include <cassert>
#include <string>
#include <vector>

using namespace std;
using namespace tdm;

static download_record
make (const string& name, int64_t created = 0)
{
  download_record r (download_origin::direct, origin_ref (1, 1), name);
  r.set_created_at (created);
  return r;
}

static void
test_insert_find ()
{
  memory_record_store s;

  record_id a (s.insert (make ("a")));
  record_id b (s.insert (make ("b")));

  assert (a != 0 && b != 0 && a != b);

  optional<download_record> r (s.find (a));
  assert (r);
  assert (r->id () == a);
  assert (r->file_name () == "a");
  assert (r->status () == download_status::pending);
  assert (r->created_at () != 0);

  assert (!s.find (b + 100));
  assert (s.count () == 2);
}

static void
test_update_erase ()
{
  memory_record_store s;
  record_id a (s.insert (make ("a")));

  record_patch p;
  p.status = download_status::queued;
  p.priority = 3;

  assert (s.update (a, p));
  assert (s.find (a)->status () == download_status::queued);
  assert (s.find (a)->priority () == 3);

  assert (!s.update (a + 1, p));

  assert (s.erase (a));
  assert (!s.erase (a));
  assert (!s.find (a));
}

static void
test_list ()
{
  memory_record_store s;

  record_id a (s.insert (make ("a", 100)));
  record_id b (s.insert (make ("b", 300)));
  record_id c (s.insert (make ("c", 200)));

  record_patch p;
  p.status = download_status::completed;
  s.update (b, p);

  // Oldest first by default.
  //
  vector<download_record> rs (s.list ());
  assert (rs.size () == 3);
  assert (rs[0].id () == a && rs[1].id () == c && rs[2].id () == b);

  record_filter f;
  f.order = record_order::newest_first;
  f.limit = 2;

  rs = s.list (f);
  assert (rs.size () == 2);
  assert (rs[0].id () == b && rs[1].id () == c);

  rs = s.list (record_filter {download_status::completed});
  assert (rs.size () == 1 && rs[0].id () == b);

  assert (s.count (record_filter {download_status::pending}) == 2);
}

// Only a completed record blocks new work for the same content.
//
static void
test_content_index ()
{
  memory_record_store s;
  basic_content_index<memory_record_store> x (s);

  download_record r (make ("a"));
  r.set_identity (content_identity ("F", "T"));
  record_id a (s.insert (r));

  assert (!x.find_completed ("F", "T"));

  for (download_status st: {download_status::failed,
                            download_status::cancelled,
                            download_status::paused,
                            download_status::downloading})
  {
    record_patch p;
    p.status = st;
    s.update (a, p);
    assert (!x.find_completed ("F", "T"));
  }

  record_patch p;
  p.status = download_status::completed;
  s.update (a, p);

  optional<download_record> d (x.find_completed ("F", "T"));
  assert (d && d->id () == a);

  // Both halves of the identity must match.
  //
  assert (!x.find_completed ("F", "other"));
  assert (!x.find_completed ("G", "T"));
  assert (!x.find_completed (content_identity ()));
}

int
main ()
{
  test_insert_find ();
  test_update_erase ();
  test_list ();
  test_content_index ();
}
