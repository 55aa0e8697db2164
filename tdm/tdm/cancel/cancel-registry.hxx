#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include <tdm/record/record-types.hxx>

namespace tdm
{
  // Why a running transfer was asked to stop. Listed from weakest to
  // strongest: a later request with a stronger reason overrides the recorded
  // one, a weaker one does not.
  //
  enum class cancel_reason
  {
    pause,   // Operator pause, record becomes paused.
    preempt, // Slot wanted by a higher priority record, becomes paused.
    cancel,  // Operator cancel, record becomes cancelled.
    erase    // Record is being removed, exit path must not write it.
  };

  std::string
  to_string (cancel_reason);

  inline std::ostream&
  operator<< (std::ostream& o, cancel_reason r)
  {
    return o << to_string (r);
  }

  // Cooperative stop flag of one running transfer.
  //
  // The transfer polls requested() at every progress report. The reason is
  // only meaningful once requested() returned true.
  //
  class cancel_token
  {
  public:
    bool
    requested () const noexcept
    {
      return requested_.load (std::memory_order_acquire);
    }

    cancel_reason
    reason () const noexcept
    {
      return reason_.load (std::memory_order_acquire);
    }

  private:
    friend class cancel_registry;

    // Called under the registry lock. Store the reason before the flag so
    // that a reader that sees the flag also sees a reason at least as strong
    // as the one that raised it.
    //
    void
    request (cancel_reason r) noexcept
    {
      if (!requested_.load (std::memory_order_relaxed) ||
          reason_.load (std::memory_order_relaxed) < r)
        reason_.store (r, std::memory_order_release);

      requested_.store (true, std::memory_order_release);
    }

    std::atomic<bool> requested_ {false};
    std::atomic<cancel_reason> reason_ {cancel_reason::pause};
  };

  // Live cancellable units of work, one per admitted record.
  //
  // An entry exists from the moment a dispatcher takes a record until its
  // exit path clears it. Requests for ids without an entry are no-ops.
  //
  class cancel_registry
  {
  public:
    using interrupt_function = std::function<void ()>;

    cancel_registry () = default;

    cancel_registry (const cancel_registry&) = delete;
    cancel_registry& operator= (const cancel_registry&) = delete;

    // Create the entry for a record about to run. Return nullptr if there is
    // already one for this id.
    //
    std::shared_ptr<cancel_token>
    enroll (record_id);

    // Register the forcible stop handle. Return false if there is no entry.
    //
    bool
    attach (record_id, interrupt_function);

    // Raise the flag and invoke the interrupt handle, if any. Return false
    // if there is no entry for this id. Never touches persisted state.
    //
    bool
    request_cancel (record_id, cancel_reason);

    // Return the recorded reason if cancellation was requested.
    //
    std::optional<cancel_reason>
    requested (record_id) const;

    bool
    contains (record_id) const;

    void
    clear (record_id);

    std::size_t
    size () const;

  private:
    struct entry
    {
      std::shared_ptr<cancel_token> token;
      interrupt_function interrupt;
    };

    mutable std::mutex mutex_;
    std::map<record_id, entry> entries_;
  };
}
