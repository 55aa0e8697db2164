#pragma once

#include <cstddef>
#include <functional>
#include <ostream>

#include <tdm/admission/admission-controller.hxx>
#include <tdm/cancel/cancel-registry.hxx>
#include <tdm/record/record-types.hxx>

namespace tdm
{
  struct recovery_report
  {
    std::size_t reset {0};    // Moved from downloading or pending to queued.
    std::size_t admitted {0}; // Handed to their dispatcher.
    std::size_t queued {0};   // Left waiting for a slot.
  };

  inline std::ostream&
  operator<< (std::ostream& o, const recovery_report& r)
  {
    return o << r.reset << " reset, " << r.admitted << " admitted, "
             << r.queued << " queued";
  }

  // Rebuild the live state from the store after a restart.
  //
  // Nothing was running when the process died, so every downloading or
  // pending record is put back in the queue and the queue is admitted in
  // priority order until the first refusal. Records that are running in
  // this process (they have a registry entry) are left alone, which makes a
  // second run a no-op. Terminal and paused records are never touched.
  //
  template <typename T>
  class basic_recovery_coordinator
  {
  public:
    using traits_type = T;
    using store_type = typename traits_type::store_type;
    using controller_type = basic_admission_controller<traits_type>;
    using restore_function = std::function<bool (const download_record&)>;

    basic_recovery_coordinator (store_type&,
                                controller_type&,
                                cancel_registry&,
                                restore_function);

    recovery_report
    recover ();

  private:
    store_type& store_;
    controller_type& controller_;
    cancel_registry& registry_;
    restore_function restore_;
  };
}

#include <tdm/recovery/recovery-coordinator.txx>
