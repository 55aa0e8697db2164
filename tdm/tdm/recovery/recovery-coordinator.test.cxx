#include <tdm/admission/admission-controller.hxx>
#include <tdm/cancel/cancel-registry.hxx>
#include <tdm/record/record-memory.hxx>
#include <tdm/recovery/recovery-coordinator.hxx>

#include <cassert>
#include <map>
#include <vector>

using namespace std;
using namespace tdm;

using traits = admission_traits<memory_record_store>;
using controller = basic_admission_controller<traits>;
using coordinator = basic_recovery_coordinator<traits>;

static record_id
add (memory_record_store& s,
     download_status st,
     int32_t prio = 0,
     int64_t created = 0)
{
  download_record r (download_origin::rule, origin_ref (1, 1, 1), "f");
  r.set_status (st);
  r.set_priority (prio);
  r.set_created_at (created);
  return s.insert (r);
}

static size_t
count (const memory_record_store& s, download_status st)
{
  return s.count (record_filter {st});
}

// Stand-in for the dispatchers: restoring a record makes it live.
//
struct restorer
{
  cancel_registry& registry;
  vector<record_id> restored;

  bool
  operator() (const download_record& r)
  {
    assert (r.status () == download_status::downloading);

    if (registry.enroll (r.id ()) == nullptr)
      return false;

    restored.push_back (r.id ());
    return true;
  }
};

// {downloading: 2, queued: 3, completed: 5} with a cap of 2 comes back as
// 2 downloading and 3 queued, and a second pass changes nothing.
//
static void
test_idempotent ()
{
  memory_record_store s;
  cancel_registry r;
  controller c (s, r, 2);

  restorer f {r, {}};
  coordinator rc (s, c, r, [&f] (const download_record& x) {return f (x);});

  for (int i (0); i != 2; ++i) add (s, download_status::downloading);
  for (int i (0); i != 3; ++i) add (s, download_status::queued);
  for (int i (0); i != 5; ++i) add (s, download_status::completed);

  map<record_id, int64_t> done;
  for (const download_record& x: s.list (record_filter {download_status::completed}))
    done[x.id ()] = x.updated_at ();

  recovery_report rep (rc.recover ());

  assert (rep.reset == 2);
  assert (rep.admitted == 2);
  assert (rep.queued == 3);

  assert (count (s, download_status::downloading) == 2);
  assert (count (s, download_status::queued) == 3);
  assert (count (s, download_status::completed) == 5);
  assert (f.restored.size () == 2);

  // Second pass.
  //
  vector<download_record> before (s.list ());

  rep = rc.recover ();

  assert (rep.reset == 0);
  assert (rep.admitted == 0);
  assert (rep.queued == 3);
  assert (f.restored.size () == 2);

  vector<download_record> after (s.list ());
  assert (before.size () == after.size ());

  for (size_t i (0); i != before.size (); ++i)
  {
    assert (before[i].status () == after[i].status ());
    assert (before[i].updated_at () == after[i].updated_at ());
  }

  // Terminal records were never written.
  //
  for (const auto& p: done)
    assert (s.find (p.first)->updated_at () == p.second);
}

// Admission follows the queue order, not the previous status.
//
static void
test_order ()
{
  memory_record_store s;
  cancel_registry r;
  controller c (s, r, 2);

  restorer f {r, {}};
  coordinator rc (s, c, r, [&f] (const download_record& x) {return f (x);});

  record_id a (add (s, download_status::downloading, 0, 100));
  record_id b (add (s, download_status::queued, 5, 200));
  record_id d (add (s, download_status::pending, 0, 50));
  record_id e (add (s, download_status::queued, 0, 300));

  recovery_report rep (rc.recover ());

  assert (rep.reset == 2);
  assert (rep.admitted == 2);
  assert (rep.queued == 2);

  assert ((f.restored == vector<record_id> {b, d}));
  assert (s.find (a)->status () == download_status::queued);
  assert (s.find (e)->status () == download_status::queued);
}

// Paused, failed and cancelled records are left where they are.
//
static void
test_settled_untouched ()
{
  memory_record_store s;
  cancel_registry r;
  controller c (s, r, 5);

  restorer f {r, {}};
  coordinator rc (s, c, r, [&f] (const download_record& x) {return f (x);});

  record_id p (add (s, download_status::paused));
  record_id x (add (s, download_status::failed));
  record_id y (add (s, download_status::cancelled));

  recovery_report rep (rc.recover ());

  assert (rep.reset == 0 && rep.admitted == 0 && rep.queued == 0);
  assert (s.find (p)->status () == download_status::paused);
  assert (s.find (x)->status () == download_status::failed);
  assert (s.find (y)->status () == download_status::cancelled);
  assert (f.restored.empty ());
}

int
main ()
{
  test_idempotent ();
  test_order ();
  test_settled_untouched ();
}
