#include <tdm/transport/spool-transport.hxx>

#include <cassert>
#include <exception>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

using namespace std;
using namespace tdm;

namespace fs = std::filesystem;
namespace asio = boost::asio;

static fs::path
scratch (const string& n)
{
  fs::path d (fs::temp_directory_path () / ("tdm-spool-transport-" + n));

  // Wipe the slate clean in case a previous run crashed.
  //
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static void
write_payload (const fs::path& p, size_t n)
{
  fs::create_directories (p.parent_path ());

  ofstream o (p, ios::binary | ios::trunc);
  for (size_t i (0); i != n; ++i)
    o.put (static_cast<char> ('a' + i % 26));
}

// Run the coroutine to completion, returning its result or rethrowing its
// exception.
//
template <typename R>
static R
run (asio::io_context& ioc, asio::awaitable<R> a)
{
  R r {};
  exception_ptr e;

  asio::co_spawn (ioc,
                  move (a),
                  [&r, &e] (exception_ptr x, R v)
                  {
                    e = x;
                    r = move (v);
                  });

  ioc.restart ();
  ioc.run ();

  if (e)
    rethrow_exception (e);

  return r;
}

static void
test_copy ()
{
  fs::path d (scratch ("copy"));

  asio::io_context ioc;
  spool_transport x (ioc, d / "spool", 1000);

  origin_ref ref (5, 42);
  assert (x.payload_path (ref) == d / "spool" / "5" / "42");

  write_payload (x.payload_path (ref), 2500);

  spool_source s (run (ioc, x.locate (download_origin::direct, ref)));
  assert (s.size == 2500);

  vector<pair<uint64_t, uint64_t>> calls;
  transfer_callback cb ([&calls] (uint64_t n, uint64_t t)
  {
    calls.emplace_back (n, t);
    return transfer_signal::proceed;
  });

  fs::path t (d / "out.bin");
  transfer_result r (run (ioc, x.transfer (1, s, t, cb)));

  assert (r.status == transfer_status::completed);
  assert (r.bytes == 2500);
  assert (fs::file_size (t) == 2500);

  // One report per chunk, the last one short.
  //
  assert (calls.size () == 3);
  assert (calls[0] == make_pair (uint64_t (1000), uint64_t (2500)));
  assert (calls[2] == make_pair (uint64_t (2500), uint64_t (2500)));

  fs::remove_all (d);
}

static void
test_missing ()
{
  fs::path d (scratch ("missing"));

  asio::io_context ioc;
  spool_transport x (ioc, d);

  bool thrown (false);
  try
  {
    run (ioc, x.locate (download_origin::rule, origin_ref (1, 2, 3)));
  }
  catch (const runtime_error& e)
  {
    thrown = true;
    assert (string (e.what ()).find ("not found") != string::npos);
  }
  assert (thrown);

  fs::remove_all (d);
}

static void
test_abort ()
{
  fs::path d (scratch ("abort"));

  asio::io_context ioc;
  spool_transport x (ioc, d, 10);

  write_payload (x.payload_path (origin_ref (1, 1)), 100);
  spool_source s (run (ioc, x.locate (download_origin::direct,
                                      origin_ref (1, 1))));

  size_t n (0);
  transfer_callback cb ([&n] (uint64_t, uint64_t)
  {
    return ++n == 2 ? transfer_signal::abort : transfer_signal::proceed;
  });

  transfer_result r (run (ioc, x.transfer (1, s, d / "out", cb)));

  assert (r.status == transfer_status::aborted);
  assert (r.bytes == 20);
  assert (n == 2);

  fs::remove_all (d);
}

// An interrupt stops the transfer at the next chunk boundary and does not
// outlive it.
//
static void
test_interrupt ()
{
  fs::path d (scratch ("interrupt"));

  asio::io_context ioc;
  spool_transport x (ioc, d, 10);

  write_payload (x.payload_path (origin_ref (1, 1)), 100);
  spool_source s (run (ioc, x.locate (download_origin::direct,
                                      origin_ref (1, 1))));

  size_t n (0);
  transfer_callback cb ([&x, &n] (uint64_t, uint64_t)
  {
    if (++n == 3)
      x.interrupt (7);

    return transfer_signal::proceed;
  });

  transfer_result r (run (ioc, x.transfer (7, s, d / "out", cb)));
  assert (r.status == transfer_status::aborted);
  assert (r.bytes == 30);

  // A stale interrupt is dropped when the next transfer starts.
  //
  x.interrupt (7);

  n = 0;
  r = run (ioc, x.transfer (7, s, d / "out", cb));
  assert (r.status == transfer_status::aborted);
  assert (r.bytes == 30);

  transfer_callback go ([] (uint64_t, uint64_t)
  {
    return transfer_signal::proceed;
  });

  x.interrupt (8);
  r = run (ioc, x.transfer (8, s, d / "out", go));
  assert (r.status == transfer_status::completed);
  assert (r.bytes == 100);

  fs::remove_all (d);
}

int
main ()
{
  test_copy ();
  test_missing ();
  test_abort ();
  test_interrupt ();
}
