#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

#include <tdm/admission/admission-controller.hxx>
#include <tdm/cancel/cancel-registry.hxx>
#include <tdm/fetch/fetch-dispatcher.hxx>
#include <tdm/fetch/fetch-router.hxx>
#include <tdm/record/content-index.hxx>
#include <tdm/record/record-types.hxx>
#include <tdm/recovery/recovery-coordinator.hxx>
#include <tdm/service/service-types.hxx>

namespace tdm
{
  template <typename S,
            typename X,
            typename C = std::chrono::steady_clock>
  struct download_service_traits
  {
    using store_type = S;
    using transport_type = X;
    using clock_type = C;
    using source_type = typename transport_type::source_type;

    using admission_traits_type = admission_traits<store_type>;
    using controller_type = basic_admission_controller<admission_traits_type>;
    using recovery_type = basic_recovery_coordinator<admission_traits_type>;
    using index_type = basic_content_index<store_type>;
    using router_type = basic_fetch_router<store_type, transport_type, clock_type>;
    using direct_dispatcher = typename router_type::direct_dispatcher;
    using rule_dispatcher = typename router_type::rule_dispatcher;

    using progress_function =
      typename fetch_traits<S, X, C>::progress_function;
    using finish_function =
      typename fetch_traits<S, X, C>::finish_function;

    static constexpr std::size_t list_limit = 50;
  };

  // Operator facade over the admission, cancellation and recovery core.
  //
  // Everything that changes the set of running transfers goes through
  // here: new candidates, operator actions, and the start-up recovery.
  // The service owns the registry, the controller and the dispatchers; the
  // store and the transport are shared with the caller.
  //
  template <typename T>
  class basic_download_service
  {
  public:
    using traits_type = T;
    using store_type = typename traits_type::store_type;
    using transport_type = typename traits_type::transport_type;
    using source_type = typename traits_type::source_type;
    using controller_type = typename traits_type::controller_type;
    using recovery_type = typename traits_type::recovery_type;
    using index_type = typename traits_type::index_type;
    using router_type = typename traits_type::router_type;
    using direct_dispatcher = typename traits_type::direct_dispatcher;
    using rule_dispatcher = typename traits_type::rule_dispatcher;
    using progress_function = typename traits_type::progress_function;
    using finish_function = typename traits_type::finish_function;

    basic_download_service (boost::asio::io_context&,
                            store_type&,
                            transport_type&,
                            download_service_config);

    basic_download_service (const basic_download_service&) = delete;
    basic_download_service& operator= (const basic_download_service&) = delete;

    // Notifications. Progress is only reported for direct downloads.
    //
    void
    on_progress (progress_function);

    void
    on_finish (finish_function);

    // Re-admit whatever was in flight when the process stopped. Call once
    // at start, before accepting new candidates.
    //
    recovery_report
    recover ();

    // Create a record for the candidate and admit it. Without a source the
    // dispatcher locates it from the origin reference.
    //
    submit_result
    submit (const download_candidate&,
            std::optional<source_type> = std::nullopt);

    // Operator actions.
    //
    operation_result
    pause (record_id);

    // Put a paused record back through admission. Failed records are not
    // retried.
    //
    operation_result
    resume (record_id);

    operation_result
    cancel (record_id);

    // Raising the priority above the configured threshold also preempts a
    // running download if there is queued work.
    //
    operation_result
    set_priority (record_id, std::int32_t);

    // Stop the record if running, remove its output file and the record.
    //
    operation_result
    erase (record_id);

    // Newest first.
    //
    std::vector<download_record>
    list (std::size_t limit = traits_type::list_limit) const;

    const download_service_config&
    config () const noexcept
    {
      return config_;
    }

    controller_type&
    controller () noexcept
    {
      return controller_;
    }

    cancel_registry&
    registry () noexcept
    {
      return registry_;
    }

  private:
    fs::path
    target_path (const download_candidate&, record_id) const;

    bool
    dispatch (record_id);

    store_type& store_;
    download_service_config config_;

    cancel_registry registry_;
    controller_type controller_;
    index_type index_;

    direct_dispatcher direct_;
    rule_dispatcher rule_;
    router_type router_;

    recovery_type recovery_;
  };
}

#include <tdm/service/download-service.txx>
