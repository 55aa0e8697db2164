#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include <tdm/admission/admission-controller.hxx>
#include <tdm/record/record-types.hxx>

namespace tdm
{
  namespace fs = std::filesystem;

  struct download_service_config
  {
    std::size_t max_concurrent {5};

    // Raising a priority above this value preempts a running download.
    //
    std::int32_t preempt_threshold {0};

    victim_policy victim {victim_policy::oldest_started};

    std::chrono::milliseconds notify_interval {2000};

    // Direct downloads, and rule downloads without a save directory, go
    // here.
    //
    fs::path download_dir;
  };

  // A file somebody wants, as produced by the direct message handler or by
  // a matching watch rule.
  //
  struct download_candidate
  {
    download_origin origin {download_origin::direct};
    origin_ref ref;

    std::string file_name;
    std::uint64_t size_bytes {0};
    std::optional<content_identity> identity;
    std::int32_t priority {0};

    // Rule downloads only. Empty means the defaults.
    //
    std::string save_dir;
    std::string filename_template;
    std::string chat_title;
  };

  enum class submit_status
  {
    started,  // Admitted and handed to the dispatcher.
    queued,   // Waiting for a slot.
    duplicate // Already completed before, nothing created.
  };

  inline std::ostream&
  operator<< (std::ostream& o, submit_status s)
  {
    switch (s)
    {
      case submit_status::started:   return o << "started";
      case submit_status::queued:    return o << "queued";
      case submit_status::duplicate: return o << "duplicate";
    }
    return o;
  }

  struct submit_result
  {
    submit_status status {submit_status::queued};

    // The new record, or the completed one for a duplicate.
    //
    record_id id {0};
  };

  enum class operation_status
  {
    ok,
    not_found,
    rejected
  };

  inline std::ostream&
  operator<< (std::ostream& o, operation_status s)
  {
    switch (s)
    {
      case operation_status::ok:        return o << "ok";
      case operation_status::not_found: return o << "not found";
      case operation_status::rejected:  return o << "rejected";
    }
    return o;
  }

  // Outcome of an operator action, with a message for the operator.
  //
  struct operation_result
  {
    operation_status status {operation_status::ok};
    std::string message;

    explicit
    operator bool () const noexcept
    {
      return status == operation_status::ok;
    }

    static operation_result
    ok (std::string m = std::string ())
    {
      return operation_result {operation_status::ok, std::move (m)};
    }

    static operation_result
    not_found (record_id id)
    {
      return operation_result {operation_status::not_found,
                               "download " + std::to_string (id) +
                               " not found"};
    }

    static operation_result
    rejected (std::string m)
    {
      return operation_result {operation_status::rejected, std::move (m)};
    }
  };
}
