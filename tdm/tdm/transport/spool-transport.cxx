#include <tdm/transport/spool-transport.hxx>

#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace std;

namespace asio = boost::asio;

namespace tdm
{
  spool_transport::
  spool_transport (asio::io_context& ioc, fs::path r, size_t n)
    : ioc_ (ioc),
      root_ (move (r)),
      chunk_size_ (n != 0 ? n : default_chunk_size)
  {
  }

  fs::path spool_transport::
  payload_path (const origin_ref& r) const
  {
    return root_ / std::to_string (r.chat_id) / std::to_string (r.message_id);
  }

  asio::awaitable<spool_source> spool_transport::
  locate (download_origin, const origin_ref& r)
  {
    fs::path p (payload_path (r));

    error_code ec;
    if (!fs::is_regular_file (p, ec))
      throw runtime_error ("message " + std::to_string (r.message_id) +
                           " in chat " + std::to_string (r.chat_id) +
                           " not found in spool");

    uint64_t n (fs::file_size (p, ec));
    if (ec)
      throw runtime_error ("unable to stat " + p.string () + ": " +
                           ec.message ());

    co_return spool_source {p, n};
  }

  asio::awaitable<transfer_result> spool_transport::
  transfer (record_id id,
            const spool_source& s,
            const fs::path& target,
            transfer_callback cb)
  {
    {
      lock_guard<mutex> l (mutex_);
      interrupted_.erase (id);
    }

    ifstream is (s.path, ios::binary);
    if (!is)
      throw runtime_error ("unable to open " + s.path.string ());

    ofstream os (target, ios::binary | ios::trunc);
    if (!os)
      throw runtime_error ("unable to create " + target.string ());

    transfer_result r;
    vector<char> b (chunk_size_);

    while (is)
    {
      is.read (b.data (), static_cast<streamsize> (b.size ()));
      size_t n (static_cast<size_t> (is.gcount ()));

      if (n == 0)
        break;

      if (!os.write (b.data (), static_cast<streamsize> (n)))
        throw runtime_error ("unable to write " + target.string ());

      r.bytes += n;

      if (cb (r.bytes, s.size) == transfer_signal::abort ||
          interrupted (id))
      {
        r.status = transfer_status::aborted;
        break;
      }

      // Let the other transfers and the operator requests run.
      //
      co_await asio::post (ioc_, asio::use_awaitable);
    }

    if (r.status == transfer_status::completed)
    {
      if (is.bad ())
        throw runtime_error ("unable to read " + s.path.string ());

      os.close ();
      if (!os)
        throw runtime_error ("unable to write " + target.string ());
    }

    {
      lock_guard<mutex> l (mutex_);
      interrupted_.erase (id);
    }

    co_return r;
  }

  void spool_transport::
  interrupt (record_id id)
  {
    lock_guard<mutex> l (mutex_);
    interrupted_.insert (id);
  }

  bool spool_transport::
  interrupted (record_id id) const
  {
    lock_guard<mutex> l (mutex_);
    return interrupted_.count (id) != 0;
  }
}
