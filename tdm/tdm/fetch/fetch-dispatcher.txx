#include <exception>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace tdm
{
  template <typename T>
  basic_fetch_dispatcher<T>::
  basic_fetch_dispatcher (boost::asio::io_context& ioc,
                          store_type& s,
                          transport_type& x,
                          controller_type& c,
                          cancel_registry& r,
                          duration i)
    : ioc_ (ioc),
      store_ (s),
      transport_ (x),
      controller_ (c),
      registry_ (r),
      interval_ (i)
  {
  }

  template <typename T>
  bool basic_fetch_dispatcher<T>::
  start (const download_record& r, source_type s)
  {
    return launch (r, std::move (s));
  }

  template <typename T>
  bool basic_fetch_dispatcher<T>::
  restore (const download_record& r)
  {
    return launch (r, std::nullopt);
  }

  template <typename T>
  bool basic_fetch_dispatcher<T>::
  launch (const download_record& r, std::optional<source_type> s)
  {
    record_id id (r.id ());

    // Register before spawning so that a cancel request issued right after
    // admission already finds the entry.
    //
    std::shared_ptr<cancel_token> t (registry_.enroll (id));

    if (t == nullptr)
    {
      std::cerr << "warning: download " << id << " is already running"
                << std::endl;
      return false;
    }

    registry_.attach (id, [this, id] () {transport_.interrupt (id);});

    boost::asio::co_spawn (
      ioc_,
      run (r, std::move (s), std::move (t)),
      [id] (std::exception_ptr e)
      {
        if (e)
        {
          try
          {
            std::rethrow_exception (e);
          }
          catch (const std::exception& x)
          {
            std::cerr << "error: download " << id << ": " << x.what ()
                      << std::endl;
          }
        }
      });

    return true;
  }

  template <typename T>
  boost::asio::awaitable<void> basic_fetch_dispatcher<T>::
  run (download_record r,
       std::optional<source_type> s,
       std::shared_ptr<cancel_token> t)
  {
    tracker_type tr (clock_type::now (), interval_);

    fetch_outcome o (fetch_outcome::failed);
    std::uint64_t bytes (0);
    std::string error;

    try
    {
      if (!s && !t->requested ())
        s = co_await transport_.locate (r.origin (), r.ref ());

      if (t->requested ())
        o = fetch_outcome::stopped;
      else
      {
        fs::path p (r.target_path ());

        if (p.empty ())
          throw std::runtime_error ("no target path");

        if (p.has_parent_path ())
        {
          std::error_code ec;
          fs::create_directories (p.parent_path (), ec);

          if (ec)
            throw std::runtime_error (
              "failed to create directory " + p.parent_path ().string () +
              ": " + ec.message ());
        }

        // Runs synchronously inside the transfer, so keep it to bounded
        // store writes. The snapshot is not authoritative: failing to write
        // it must not fail the transfer.
        //
        transfer_callback cb (
          [this, &r, &t, &tr] (std::uint64_t n, std::uint64_t total)
          {
            if (t->requested ())
              return transfer_signal::abort;

            typename clock_type::time_point now (clock_type::now ());
            progress_sample ps (tr.update (n, total, now));

            record_patch p;
            p.progress_percent = ps.percent;
            p.throughput_bps = ps.throughput_bps;

            if (total != 0)
              p.size_bytes = total;

            try
            {
              store_.update (r.id (), p);

              if (traits_type::progress_notifications &&
                  progress_ &&
                  tr.notify_due (now))
                progress_ (r, ps);
            }
            catch (const std::exception& e)
            {
              std::cerr << "warning: unable to record progress of download "
                        << r.id () << ": " << e.what () << std::endl;
            }

            return transfer_signal::proceed;
          });

        transfer_result x (co_await transport_.transfer (r.id (), *s, p, cb));
        bytes = x.bytes;

        if (x.status == transfer_status::completed)
          o = fetch_outcome::completed;
        else if (t->requested ())
          o = fetch_outcome::stopped;
        else
          error = "transfer aborted by transport";
      }
    }
    catch (const std::exception& e)
    {
      // An interrupt may surface as an error from the transport.
      //
      if (t->requested ())
        o = fetch_outcome::stopped;
      else
        error = e.what ();
    }

    finish (r, o, bytes, error, *t, tr);
  }

  template <typename T>
  void basic_fetch_dispatcher<T>::
  finish (const download_record& r,
          fetch_outcome o,
          std::uint64_t bytes,
          const std::string& error,
          const cancel_token& t,
          const tracker_type& tr)
  {
    record_id id (r.id ());

    // Clear first: once the status below leaves downloading the record may
    // be resumed, and its new run must be able to enroll.
    //
    registry_.clear (id);

    bool erased (t.requested () && t.reason () == cancel_reason::erase);

    // Remove partial output. An erased record goes regardless of how far it
    // got.
    //
    if (erased || o == fetch_outcome::stopped)
    {
      std::error_code ec;
      if (!r.target_path ().empty () &&
          !fs::remove (r.target_path (), ec) && ec)
        std::cerr << "warning: unable to remove " << r.target_path ()
                  << ": " << ec.message () << std::endl;
    }

    // The erase path has already released the slot and removed the record.
    //
    if (erased)
      return;

    record_patch p;
    p.throughput_bps = 0.0;

    switch (o)
    {
    case fetch_outcome::completed:
      {
        p.status = download_status::completed;
        p.progress_percent = 100.0;
        p.throughput_bps = tr.average_throughput (bytes, clock_type::now ());
        p.size_bytes = bytes;
        p.error = std::string ();
        break;
      }
    case fetch_outcome::failed:
      {
        p.status = download_status::failed;
        p.error = error;

        std::cerr << "error: download " << id << " (" << r.file_name ()
                  << ") failed: " << error << std::endl;
        break;
      }
    case fetch_outcome::stopped:
      {
        p.status = t.reason () == cancel_reason::cancel
          ? download_status::cancelled
          : download_status::paused;
        p.error = to_string (t.reason ());
        p.progress_percent = 0.0;
        break;
      }
    }

    // Whatever happens to the write, the slot must be handed back.
    //
    try
    {
      store_.update (id, p);

      if (finish_)
      {
        std::optional<download_record> u (store_.find (id));
        finish_ (u ? *u : r, o);
      }
    }
    catch (const std::exception& e)
    {
      std::cerr << "error: unable to record outcome of download " << id
                << ": " << e.what () << std::endl;
    }

    controller_.on_finished (id);
  }
}
