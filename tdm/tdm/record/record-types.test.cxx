#include <tdm/record/record-query.hxx>
#include <tdm/record/record-types.hxx>

#include <cassert>
#include <sstream>
#include <string>
#include <vector>

using namespace std;
using namespace tdm;

// Every status must survive the trip through its persisted name, since the
// operator commands parse what --list prints.
//
static void
test_status_names ()
{
  for (download_status s: {download_status::pending,
                           download_status::queued,
                           download_status::downloading,
                           download_status::paused,
                           download_status::completed,
                           download_status::failed,
                           download_status::cancelled})
  {
    optional<download_status> p (to_download_status (to_string (s)));
    assert (p && *p == s);
  }

  assert (!to_download_status ("running"));
  assert (!to_download_status (""));

  assert (to_download_origin ("rule") == download_origin::rule);
  assert (!to_download_origin ("bot"));
}

static void
test_settled ()
{
  assert (!settled (download_status::pending));
  assert (!settled (download_status::queued));
  assert (!settled (download_status::downloading));

  assert (settled (download_status::paused));
  assert (settled (download_status::completed));
  assert (settled (download_status::failed));
  assert (settled (download_status::cancelled));
}

static void
test_identity ()
{
  download_record r (download_origin::direct, origin_ref (1, 2), "a.bin");
  assert (!r.identity ());

  r.set_identity (content_identity ("F", "T"));
  assert (r.identity () && *r.identity () == content_identity ("F", "T"));
}

// Patches only write what they carry.
//
static void
test_patch ()
{
  download_record r (download_origin::rule, origin_ref (1, 2, 3), "a.bin",
                     100, 4);
  r.set_error ("old");

  record_patch p;
  p.status = download_status::queued;
  p.apply (r);

  assert (r.status () == download_status::queued);
  assert (r.priority () == 4);
  assert (r.size_bytes () == 100);
  assert (r.error () == "old");
  assert (r.updated_at () != 0);

  record_patch e;
  e.error = string ();
  e.apply (r);
  assert (r.error ().empty ());
}

static download_record
make (int32_t prio, int64_t created)
{
  download_record r (download_origin::direct, origin_ref (1, 1), "f");
  r.set_priority (prio);
  r.set_created_at (created);
  return r;
}

static void
test_queue_order ()
{
  download_record a (make (0, 100));
  download_record b (make (0, 200));
  download_record c (make (5, 300));

  // Higher priority first, then earlier creation.
  //
  assert (queue_before (c, a));
  assert (queue_before (a, b));
  assert (!queue_before (b, a));
  assert (!queue_before (a, a));
}

static void
test_filter ()
{
  download_record r (download_origin::rule, origin_ref (1, 2, 3), "a.bin");
  r.set_status (download_status::completed);
  r.set_identity (content_identity ("F", "T"));

  assert (record_filter ().matches (r));
  assert ((record_filter {download_status::completed}).matches (r));
  assert (!(record_filter {download_status::queued,
                           download_status::pending}).matches (r));

  record_filter o;
  o.origin = download_origin::direct;
  assert (!o.matches (r));

  record_filter i;
  i.identity = content_identity ("F", "T");
  assert (i.matches (r));

  i.identity = content_identity ("F", "other");
  assert (!i.matches (r));
}

static void
test_arrange ()
{
  vector<download_record> rs {make (0, 300),
                              make (0, 100),
                              make (0, 200)};

  record_filter f;
  f.order = record_order::newest_first;
  f.limit = 2;

  arrange (rs, f);

  assert (rs.size () == 2);
  assert (rs[0].created_at () == 300);
  assert (rs[1].created_at () == 200);
}

static void
test_print ()
{
  download_record r (download_origin::direct, origin_ref (7, 8), "a.bin");
  r.set_error ("boom");

  ostringstream o;
  o << r;

  assert (o.str ().find ("direct 7/8 pending 'a.bin'") != string::npos);
  assert (o.str ().find ("(boom)") != string::npos);
}

int
main ()
{
  test_status_names ();
  test_settled ();
  test_identity ();
  test_patch ();
  test_queue_order ();
  test_filter ();
  test_arrange ();
  test_print ();
}
