#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <tdm/cancel/cancel-registry.hxx>
#include <tdm/record/record-query.hxx>
#include <tdm/record/record-types.hxx>

namespace tdm
{
  // Which running record gives up its slot to a prioritized one.
  //
  enum class victim_policy
  {
    oldest_started,  // Earliest started_at.
    lowest_priority  // Lowest priority, then earliest started_at.
  };

  std::string
  to_string (victim_policy);

  std::optional<victim_policy>
  to_victim_policy (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, victim_policy p)
  {
    return o << to_string (p);
  }

  template <typename S>
  struct admission_traits
  {
    using store_type = S;

    static constexpr std::size_t max_concurrent = 5;
    static constexpr victim_policy victim = victim_policy::oldest_started;
  };

  // Global concurrency cap.
  //
  // This is the only place that moves a record into downloading. The count
  // of downloading records and the status write happen under one mutex, so
  // concurrent admissions can never exceed the cap. The controller never
  // waits on a transfer: promoted records are handed to the dispatch
  // function after the mutex is released.
  //
  template <typename T>
  class basic_admission_controller
  {
  public:
    using traits_type = T;
    using store_type = typename traits_type::store_type;
    using dispatch_function = std::function<void (const download_record&)>;

    basic_admission_controller (store_type&,
                                cancel_registry&,
                                std::size_t max_concurrent =
                                  traits_type::max_concurrent,
                                victim_policy = traits_type::victim);

    basic_admission_controller (const basic_admission_controller&) = delete;
    basic_admission_controller& operator= (const basic_admission_controller&) = delete;

    // Where promoted records go. Must be set before the first on_finished().
    //
    void
    set_dispatch (dispatch_function f)
    {
      dispatch_ = std::move (f);
    }

    // Move the record to downloading if there is a free slot and return
    // true. Otherwise move it to queued and return false. A missing record
    // or one that is already downloading yields false without any write.
    //
    bool
    try_admit (record_id);

    // A slot may have been freed by this record. Promote the best queued
    // records while below the cap and dispatch them. Return the number of
    // promoted records. Calling this without a freed slot is harmless.
    //
    std::size_t
    on_finished (record_id);

    // Take a queued or pending record out of the queue by moving it to the
    // given status. Return false if the record is not waiting (it may have
    // just been promoted).
    //
    bool
    withdraw (record_id, download_status, const std::string& reason);

    // Ask one other downloading record to give up its slot in favor of the
    // given one. Return the victim, if any. Nothing is preempted when there
    // is no queued work to take the freed slot.
    //
    std::optional<record_id>
    preempt (record_id favored);

    std::size_t
    active_count () const;

    std::size_t
    max_concurrent () const noexcept
    {
      return max_;
    }

    victim_policy
    policy () const noexcept
    {
      return policy_;
    }

  private:
    std::size_t
    downloading () const;

    void
    promote (record_id);

    store_type& store_;
    cancel_registry& registry_;

    std::size_t max_;
    victim_policy policy_;

    dispatch_function dispatch_;

    mutable std::mutex mutex_;
  };
}

#include <tdm/admission/admission-controller.txx>
