#pragma once

#include <cstdint>
#include <functional>
#include <ostream>

namespace tdm
{
  // What a progress callback tells the transport to do next.
  //
  enum class transfer_signal
  {
    proceed,
    abort
  };

  enum class transfer_status
  {
    completed, // All bytes are in the target file.
    aborted    // Stopped by the callback or by an interrupt.
  };

  inline std::ostream&
  operator<< (std::ostream& o, transfer_status s)
  {
    switch (s)
    {
      case transfer_status::completed: return o << "completed";
      case transfer_status::aborted:   return o << "aborted";
    }
    return o;
  }

  struct transfer_result
  {
    transfer_status status {transfer_status::completed};
    std::uint64_t bytes {0};
  };

  // Called by the transport with (bytes so far, total bytes or 0).
  //
  using transfer_callback =
    std::function<transfer_signal (std::uint64_t, std::uint64_t)>;

  // How a dispatcher run ended.
  //
  enum class fetch_outcome
  {
    completed,
    failed,
    stopped // Cancellation was requested.
  };

  inline std::ostream&
  operator<< (std::ostream& o, fetch_outcome x)
  {
    switch (x)
    {
      case fetch_outcome::completed: return o << "completed";
      case fetch_outcome::failed:    return o << "failed";
      case fetch_outcome::stopped:   return o << "stopped";
    }
    return o;
  }
}
