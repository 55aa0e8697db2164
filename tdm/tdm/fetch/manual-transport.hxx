#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>

#include <boost/asio.hpp>

#include <tdm/fetch/fetch-types.hxx>
#include <tdm/record/record-types.hxx>

namespace tdm
{
  namespace fs = std::filesystem;

  struct manual_source
  {
    origin_ref ref;
  };

  // Transport whose transfers advance only when told to.
  //
  // A transfer creates its target file and then waits for steps queued with
  // progress(), complete() or fail(). Each step runs on the io_context, so
  // a test queues steps and then polls the context to observe the effect.
  //
  class manual_transport
  {
  public:
    using source_type = manual_source;

    explicit
    manual_transport (boost::asio::io_context&);

    boost::asio::awaitable<source_type>
    locate (download_origin, const origin_ref&);

    boost::asio::awaitable<transfer_result>
    transfer (record_id,
              const source_type&,
              const fs::path& target,
              transfer_callback);

    // Only counted: transfers stop through the callback.
    //
    void
    interrupt (record_id);

    // Driver.
    //

    // Make locate() fail for this message.
    //
    void
    forget (std::int64_t message_id);

    void
    progress (record_id, std::uint64_t bytes, std::uint64_t total);

    void
    complete (record_id, std::uint64_t bytes);

    void
    fail (record_id, std::string what);

    bool
    active (record_id) const;

    std::size_t
    interrupts (record_id) const;

    // Progress callbacks delivered to the dispatcher so far.
    //
    std::size_t
    callbacks (record_id) const;

  private:
    enum class step_kind {progress, complete, fail};

    struct step
    {
      step_kind kind;
      std::uint64_t bytes;
      std::uint64_t total;
      std::string what;
    };

    struct channel
    {
      std::deque<step> steps;
      std::unique_ptr<boost::asio::steady_timer> timer;
      bool active {false};
      std::size_t interrupts {0};
      std::size_t callbacks {0};
    };

    channel&
    get (record_id);

    void
    push (record_id, step);

    boost::asio::io_context& ioc_;
    std::map<record_id, channel> channels_;
    std::set<std::int64_t> forgotten_;
  };
}
