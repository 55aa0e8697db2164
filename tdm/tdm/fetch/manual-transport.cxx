#include <tdm/fetch/manual-transport.hxx>

#include <fstream>
#include <stdexcept>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace std;

namespace asio = boost::asio;

namespace tdm
{
  manual_transport::
  manual_transport (asio::io_context& ioc)
    : ioc_ (ioc)
  {
  }

  manual_transport::channel& manual_transport::
  get (record_id id)
  {
    channel& c (channels_[id]);

    if (c.timer == nullptr)
      c.timer = make_unique<asio::steady_timer> (ioc_);

    return c;
  }

  void manual_transport::
  push (record_id id, step s)
  {
    channel& c (get (id));
    c.steps.push_back (move (s));
    c.timer->cancel ();
  }

  asio::awaitable<manual_source> manual_transport::
  locate (download_origin, const origin_ref& r)
  {
    if (forgotten_.count (r.message_id) != 0)
      throw runtime_error ("message " + std::to_string (r.message_id) +
                           " not found");

    co_return manual_source {r};
  }

  asio::awaitable<transfer_result> manual_transport::
  transfer (record_id id,
            const source_type&,
            const fs::path& target,
            transfer_callback cb)
  {
    {
      ofstream o (target, ios::binary | ios::trunc);
      if (!o)
        throw runtime_error ("unable to create " + target.string ());
    }

    get (id).active = true;

    transfer_result r;
    r.status = transfer_status::aborted;

    for (;;)
    {
      channel& c (get (id));

      if (c.steps.empty ())
      {
        boost::system::error_code ec;
        c.timer->expires_at (asio::steady_timer::time_point::max ());
        co_await c.timer->async_wait (
          asio::redirect_error (asio::use_awaitable, ec));
        continue;
      }

      step s (move (c.steps.front ()));
      c.steps.pop_front ();

      if (s.kind == step_kind::fail)
      {
        c.active = false;
        throw runtime_error (s.what);
      }

      if (s.kind == step_kind::complete)
      {
        ofstream o (target, ios::binary | ios::trunc);
        o << string (static_cast<size_t> (s.bytes), 'x');

        r.status = transfer_status::completed;
        r.bytes = s.bytes;
        break;
      }

      ++c.callbacks;
      r.bytes = s.bytes;

      if (cb (s.bytes, s.total) == transfer_signal::abort)
        break;
    }

    get (id).active = false;
    co_return r;
  }

  void manual_transport::
  interrupt (record_id id)
  {
    ++get (id).interrupts;
  }

  void manual_transport::
  forget (int64_t m)
  {
    forgotten_.insert (m);
  }

  void manual_transport::
  progress (record_id id, uint64_t bytes, uint64_t total)
  {
    push (id, step {step_kind::progress, bytes, total, string ()});
  }

  void manual_transport::
  complete (record_id id, uint64_t bytes)
  {
    push (id, step {step_kind::complete, bytes, bytes, string ()});
  }

  void manual_transport::
  fail (record_id id, string what)
  {
    push (id, step {step_kind::fail, 0, 0, move (what)});
  }

  bool manual_transport::
  active (record_id id) const
  {
    auto i (channels_.find (id));
    return i != channels_.end () && i->second.active;
  }

  size_t manual_transport::
  interrupts (record_id id) const
  {
    auto i (channels_.find (id));
    return i != channels_.end () ? i->second.interrupts : 0;
  }

  size_t manual_transport::
  callbacks (record_id id) const
  {
    auto i (channels_.find (id));
    return i != channels_.end () ? i->second.callbacks : 0;
  }
}
