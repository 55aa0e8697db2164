#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio.hpp>

#include <tdm/admission/admission-controller.hxx>
#include <tdm/cancel/cancel-registry.hxx>
#include <tdm/fetch/fetch-types.hxx>
#include <tdm/progress/progress-tracker.hxx>
#include <tdm/record/record-types.hxx>

namespace tdm
{
  namespace fs = std::filesystem;

  // Fetch dispatcher traits.
  //
  // The transport type must provide:
  //
  //   using source_type = ...;
  //
  //   awaitable<source_type>
  //   locate (download_origin, const origin_ref&);
  //
  //   awaitable<transfer_result>
  //   transfer (record_id, const source_type&, const fs::path&,
  //             transfer_callback);
  //
  //   void
  //   interrupt (record_id);
  //
  // locate() and transfer() report failures by throwing.
  //
  template <typename S,
            typename X,
            typename C = std::chrono::steady_clock>
  struct fetch_traits
  {
    using store_type = S;
    using transport_type = X;
    using clock_type = C;
    using source_type = typename transport_type::source_type;

    using controller_type =
      basic_admission_controller<admission_traits<store_type>>;

    using tracker_type =
      basic_progress_tracker<progress_tracker_traits<std::string, clock_type>>;

    // Throttled progress notification.
    //
    using progress_function =
      std::function<void (const download_record&, const progress_sample&)>;

    // Terminal notification with the final state of the record.
    //
    using finish_function =
      std::function<void (const download_record&, fetch_outcome)>;
  };

  // Files sent to the agent directly. The requester watches these, so they
  // get progress notifications.
  //
  template <typename S, typename X, typename C = std::chrono::steady_clock>
  struct direct_fetch_traits: fetch_traits<S, X, C>
  {
    static constexpr download_origin origin = download_origin::direct;
    static constexpr bool progress_notifications = true;
  };

  // Files picked up by watch rules. Only the outcome is reported.
  //
  template <typename S, typename X, typename C = std::chrono::steady_clock>
  struct rule_fetch_traits: fetch_traits<S, X, C>
  {
    static constexpr download_origin origin = download_origin::rule;
    static constexpr bool progress_notifications = false;
  };

  // Run admitted records of one origin to a terminal state.
  //
  // Each transfer is a coroutine on the io_context. It registers with the
  // cancellation registry before it is spawned, persists a progress
  // snapshot on every transport callback, and on exit writes the terminal
  // status, clears its registry entry, and hands the slot back to the
  // admission controller.
  //
  template <typename T>
  class basic_fetch_dispatcher
  {
  public:
    using traits_type = T;
    using store_type = typename traits_type::store_type;
    using transport_type = typename traits_type::transport_type;
    using clock_type = typename traits_type::clock_type;
    using source_type = typename traits_type::source_type;
    using controller_type = typename traits_type::controller_type;
    using tracker_type = typename traits_type::tracker_type;
    using progress_function = typename traits_type::progress_function;
    using finish_function = typename traits_type::finish_function;
    using duration = typename tracker_type::duration;

    static constexpr download_origin origin = traits_type::origin;

    basic_fetch_dispatcher (boost::asio::io_context&,
                            store_type&,
                            transport_type&,
                            controller_type&,
                            cancel_registry&,
                            duration notify_interval =
                              std::chrono::milliseconds (
                                tracker_type::traits_type::notify_interval_ms));

    basic_fetch_dispatcher (const basic_fetch_dispatcher&) = delete;
    basic_fetch_dispatcher& operator= (const basic_fetch_dispatcher&) = delete;

    void
    on_progress (progress_function f)
    {
      progress_ = std::move (f);
    }

    void
    on_finish (finish_function f)
    {
      finish_ = std::move (f);
    }

    // Start a freshly admitted record whose source is already at hand.
    // Return false if the record is already running.
    //
    bool
    start (const download_record&, source_type);

    // Start an admitted record that was promoted from the queue or
    // recovered after a restart. The source is located again from the
    // origin reference; if that fails the record fails.
    //
    bool
    restore (const download_record&);

  private:
    bool
    launch (const download_record&, std::optional<source_type>);

    boost::asio::awaitable<void>
    run (download_record,
         std::optional<source_type>,
         std::shared_ptr<cancel_token>);

    void
    finish (const download_record&,
            fetch_outcome,
            std::uint64_t bytes,
            const std::string& error,
            const cancel_token&,
            const tracker_type&);

    boost::asio::io_context& ioc_;
    store_type& store_;
    transport_type& transport_;
    controller_type& controller_;
    cancel_registry& registry_;
    duration interval_;

    progress_function progress_;
    finish_function finish_;
  };
}

#include <tdm/fetch/fetch-dispatcher.txx>
