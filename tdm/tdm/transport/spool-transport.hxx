#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <set>
#include <utility>

#include <boost/asio.hpp>

#include <tdm/fetch/fetch-types.hxx>
#include <tdm/record/record-types.hxx>

namespace tdm
{
  namespace fs = std::filesystem;

  struct spool_source
  {
    fs::path path;
    std::uint64_t size {0};
  };

  // Transport serving message payloads from a local spool directory.
  //
  // The payload of message M in chat C is the file <root>/C/M. Another
  // process (or the operator) drops files there; we copy them to the
  // target in chunks, reporting progress after each one.
  //
  class spool_transport
  {
  public:
    using source_type = spool_source;

    static constexpr std::size_t default_chunk_size = 64 * 1024;

    spool_transport (boost::asio::io_context&,
                     fs::path root,
                     std::size_t chunk_size = default_chunk_size);

    spool_transport (const spool_transport&) = delete;
    spool_transport& operator= (const spool_transport&) = delete;

    const fs::path&
    root () const noexcept
    {
      return root_;
    }

    // Path where the payload of this message is expected.
    //
    fs::path
    payload_path (const origin_ref&) const;

    // Throw std::runtime_error if the payload is not there.
    //
    boost::asio::awaitable<source_type>
    locate (download_origin, const origin_ref&);

    boost::asio::awaitable<transfer_result>
    transfer (record_id,
              const source_type&,
              const fs::path& target,
              transfer_callback);

    // Make the running transfer of this record stop at the next chunk.
    //
    void
    interrupt (record_id);

  private:
    bool
    interrupted (record_id) const;

    boost::asio::io_context& ioc_;
    fs::path root_;
    std::size_t chunk_size_;

    mutable std::mutex mutex_;
    std::set<record_id> interrupted_;
  };
}
