#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <tdm/progress/progress-tracker.hxx>
#include <tdm/record/record-database.hxx>
#include <tdm/service/download-service.hxx>
#include <tdm/tdm-options.hxx>
#include <tdm/transport/spool-transport.hxx>

#include <tdm/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace tdm
{
  using download_service =
    basic_download_service<download_service_traits<record_database,
                                                   spool_transport>>;

  using formatter = progress_tracker_traits<>;

  // Determine the directory for the database and the default download and
  // spool locations.
  //
  // Respect the XDG Base Directory specification. If we can't create the
  // directory there (read-only home, restricted environment), fall back to
  // a local .tdm in the current working directory.
  //
  static fs::path
  resolve_data_root ()
  {
    fs::path d;

    if (const char* v = getenv ("XDG_DATA_HOME"))
      d = fs::path (v) / "tdm";
    else if (const char* h = getenv ("HOME"))
      d = fs::path (h) / ".local" / "share" / "tdm";
    else
      d = fs::current_path () / ".tdm";

    error_code ec;
    fs::create_directories (d, ec);

    if (ec)
    {
      d = fs::current_path () / ".tdm";
      fs::create_directories (d, ec);
    }

    return d;
  }

  static void
  print_list (ostream& o, const vector<download_record>& rs)
  {
    if (rs.empty ())
    {
      o << "no downloads" << endl;
      return;
    }

    o << left
      << setw (6)  << "ID"
      << setw (12) << "STATUS"
      << setw (8)  << "ORIGIN"
      << setw (6)  << "PRIO"
      << setw (8)  << "DONE"
      << setw (12) << "SIZE"
      << "NAME" << endl;

    for (const download_record& r: rs)
    {
      ostringstream p;
      p << fixed << setprecision (1) << r.progress_percent () << '%';

      o << left
        << setw (6)  << r.id ()
        << setw (12) << to_string (r.status ())
        << setw (8)  << to_string (r.origin ())
        << setw (6)  << r.priority ()
        << setw (8)  << p.str ()
        << setw (12) << formatter::format_bytes (r.size_bytes ())
        << r.file_name ();

      if (!r.error ().empty ())
        o << " (" << r.error () << ')';

      o << endl;
    }
  }

  // Print the outcome of an operator action. Return false if it did not
  // succeed.
  //
  static bool
  report (const char* action, record_id id, const operation_result& r)
  {
    if (r)
    {
      cout << action << ' ' << id << ": " << r.message << endl;
      return true;
    }

    cerr << "error: " << action << ' ' << id << ": " << r.message << endl;
    return false;
  }

  // Keep the context alive while anything is registered as running, then
  // release the signal set so that run() can return.
  //
  static asio::awaitable<void>
  wait_idle (download_service& s, asio::signal_set& ss)
  {
    asio::steady_timer t (co_await asio::this_coro::executor);

    while (s.registry ().size () != 0)
    {
      t.expires_after (chrono::milliseconds (200));
      co_await t.async_wait (asio::use_awaitable);
    }

    ss.cancel ();
  }
}

int
main (int argc, char* argv[])
{
  using namespace tdm;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "tdm " << TDM_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: tdm [options]" << "\n"
        << "options:"             << "\n";

      opt.print_usage (o);

      return 0;
    }

    download_service_config cfg;

    optional<victim_policy> vp (to_victim_policy (opt.preempt_victim ()));
    if (!vp)
      throw cli::invalid_value ("--preempt-victim", opt.preempt_victim ());

    if (opt.jobs () == 0)
      throw cli::invalid_value ("--jobs", "0");

    fs::path data (opt.data_dir_specified ()
                   ? fs::path (opt.data_dir ())
                   : resolve_data_root ());

    cfg.max_concurrent = opt.jobs ();
    cfg.preempt_threshold = opt.preempt_threshold ();
    cfg.victim = *vp;
    cfg.notify_interval = chrono::milliseconds (opt.notify_interval ());
    cfg.download_dir = opt.download_dir_specified ()
      ? fs::path (opt.download_dir ())
      : data / "downloads";

    fs::path spool (opt.spool_dir_specified ()
                    ? fs::path (opt.spool_dir ())
                    : data / "spool");

    record_database db (data);

    if (!db.check ())
      cerr << "warning: integrity check failed for " << db.path () << endl;

    asio::io_context ioc;
    spool_transport transport (ioc, spool, opt.chunk_size ());
    download_service svc (ioc, db, transport, cfg);

    // Handle --list. Listing is read-only: no recovery, nothing started.
    //
    if (opt.list ())
    {
      print_list (cout, svc.list (opt.limit ()));
      return 0;
    }

    bool verbose (opt.verbose ());

    svc.on_progress (
      [verbose] (const download_record& r, const progress_sample& s)
      {
        if (!verbose)
          return;

        cout << r.id () << ' ' << r.file_name () << ": "
             << fixed << setprecision (1) << s.percent << "% "
             << formatter::format_bytes (s.bytes);

        if (s.total_bytes != 0)
          cout << " of " << formatter::format_bytes (s.total_bytes);

        cout << ", " << formatter::format_speed (s.throughput_bps) << endl;
      });

    svc.on_finish (
      [] (const download_record& r, fetch_outcome o)
      {
        switch (o)
        {
        case fetch_outcome::completed:
          {
            cout << r.id () << ' ' << r.file_name () << ": completed, "
                 << formatter::format_bytes (r.size_bytes ()) << " at "
                 << formatter::format_speed (r.throughput_bps ()) << " -> "
                 << r.target_path () << endl;
            break;
          }
        case fetch_outcome::failed:
          {
            // Already diagnosed by the dispatcher.
            //
            break;
          }
        case fetch_outcome::stopped:
          {
            cout << r.id () << ' ' << r.file_name () << ": " << r.error ()
                 << endl;
            break;
          }
        }
      });

    recovery_report rep (svc.recover ());

    if (verbose || rep.reset != 0 || rep.admitted != 0)
      cout << "recovery: " << rep << endl;

    // Operator actions.
    //
    bool ok (true);

    if (opt.pause_specified ())
      ok = report ("pause", opt.pause (), svc.pause (opt.pause ())) && ok;

    if (opt.resume_specified ())
      ok = report ("resume", opt.resume (), svc.resume (opt.resume ())) && ok;

    if (opt.cancel_specified ())
      ok = report ("cancel", opt.cancel (), svc.cancel (opt.cancel ())) && ok;

    if (opt.priority_specified ())
      ok = report ("priority",
                   opt.priority (),
                   svc.set_priority (opt.priority (), opt.value ())) && ok;

    if (opt.erase_specified ())
      ok = report ("delete", opt.erase (), svc.erase (opt.erase ())) && ok;

    // Handle --submit.
    //
    if (opt.submit ())
    {
      if (!opt.chat_specified ())
        throw cli::missing_value ("--chat");

      if (!opt.message_specified ())
        throw cli::missing_value ("--message");

      optional<download_origin> org (to_download_origin (opt.origin ()));
      if (!org)
        throw cli::invalid_value ("--origin", opt.origin ());

      download_candidate c;
      c.origin = *org;
      c.ref = origin_ref (opt.chat (),
                          opt.message (),
                          *org == download_origin::rule ? opt.rule () : 0);
      c.file_name = opt.name ();
      c.size_bytes = opt.size ();
      c.priority = opt.submit_priority ();

      if (opt.file_id_specified ())
        c.identity = content_identity (opt.file_id (), opt.access_token ());

      c.save_dir = opt.save_dir ();
      c.filename_template = opt.filename_template ();
      c.chat_title = opt.chat_title ();

      submit_result r (svc.submit (c));

      switch (r.status)
      {
      case submit_status::started:
      case submit_status::queued:
        {
          cout << "download " << r.id << ' ' << r.status << endl;
          break;
        }
      case submit_status::duplicate:
        {
          cout << "already downloaded as " << r.id << endl;
          break;
        }
      }
    }

    if (opt.no_run ())
      return ok ? 0 : 1;

    // Stop on SIGINT/SIGTERM. Whatever is still downloading stays recorded
    // as such and is picked up by the next start.
    //
    asio::signal_set signals (ioc, SIGINT, SIGTERM);
    signals.async_wait (
      [&ioc] (const boost::system::error_code& ec, int)
      {
        if (ec)
          return;

        cerr << "warning: interrupted, unfinished downloads resume on next "
             << "start" << endl;
        ioc.stop ();
      });

    asio::co_spawn (
      ioc,
      wait_idle (svc, signals),
      [] (exception_ptr ex)
      {
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
          }
        }
      });

    ioc.run ();
    return ok ? 0 : 1;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
