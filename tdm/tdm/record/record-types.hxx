#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

// The persistence mapping lives in record-mapping.hxx so that the rest of
// the library does not depend on the ODB runtime. We only need to befriend
// its access class here.
//
namespace odb
{
  class access;
}

namespace tdm
{
  using record_id = std::uint64_t;

  // Where a download attempt is in its life.
  //
  // Only the admission controller moves a record into downloading. The
  // statuses after it are either terminal (completed, failed, cancelled) or
  // parked by the operator (paused).
  //
  enum class download_status
  {
    pending,     // Inserted, not yet seen by admission.
    queued,      // Waiting for a free slot.
    downloading, // Holds a slot, transfer running.
    paused,      // Stopped by the operator or preempted.
    completed,   // Transfer finished.
    failed,      // Transfer gave up with an error.
    cancelled    // Stopped by the operator for good.
  };

  std::string
  to_string (download_status);

  std::optional<download_status>
  to_download_status (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, download_status s)
  {
    return o << to_string (s);
  }

  // Statuses recovery must leave alone.
  //
  inline bool
  settled (download_status s) noexcept
  {
    return s == download_status::completed ||
           s == download_status::failed    ||
           s == download_status::cancelled ||
           s == download_status::paused;
  }

  // The subsystem that produced the candidate.
  //
  enum class download_origin
  {
    direct, // File sent to the agent in a private chat.
    rule    // File matched by a group watch rule.
  };

  std::string
  to_string (download_origin);

  std::optional<download_origin>
  to_download_origin (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, download_origin x)
  {
    return o << to_string (x);
  }

  // Enough to find the source message again after a restart.
  //
  struct origin_ref
  {
    std::int64_t chat_id {0};
    std::int64_t message_id {0};
    std::uint64_t rule_id {0}; // 0 for direct downloads.

    origin_ref () = default;

    origin_ref (std::int64_t c, std::int64_t m, std::uint64_t r = 0)
      : chat_id (c), message_id (m), rule_id (r)
    {
    }
  };

  inline bool
  operator== (const origin_ref& x, const origin_ref& y)
  {
    return x.chat_id == y.chat_id &&
           x.message_id == y.message_id &&
           x.rule_id == y.rule_id;
  }

  inline std::ostream&
  operator<< (std::ostream& o, const origin_ref& r)
  {
    o << r.chat_id << '/' << r.message_id;
    if (r.rule_id != 0)
      o << " [rule " << r.rule_id << ']';
    return o;
  }

  // Stable identity of the transferable object as exposed by the transport.
  // Only used to skip files we already have.
  //
  struct content_identity
  {
    std::string file_id;
    std::string access_token;

    content_identity () = default;

    content_identity (std::string f, std::string a)
      : file_id (std::move (f)), access_token (std::move (a))
    {
    }

    bool
    empty () const noexcept
    {
      return file_id.empty ();
    }
  };

  inline bool
  operator== (const content_identity& x, const content_identity& y)
  {
    return x.file_id == y.file_id && x.access_token == y.access_token;
  }

  // Microseconds since the epoch. The resolution matters: created_at is the
  // FIFO tie-breaker between equal priorities.
  //
  std::int64_t
  current_timestamp_us ();

  class memory_record_store;

  // One transfer attempt.
  //
  class download_record
  {
  public:
    download_record () = default;

    download_record (download_origin o,
                     origin_ref r,
                     std::string name,
                     std::uint64_t size = 0,
                     std::int32_t priority = 0)
      : origin_ (o),
        origin_ref_ (r),
        file_name_ (std::move (name)),
        size_bytes_ (size),
        priority_ (priority)
    {
    }

    // Accessors.
    //
    record_id
    id () const noexcept { return id_; }

    download_origin
    origin () const noexcept { return origin_; }

    const origin_ref&
    ref () const noexcept { return origin_ref_; }

    std::optional<content_identity>
    identity () const
    {
      if (file_id_.empty ())
        return std::nullopt;

      return content_identity (file_id_, access_token_);
    }

    const std::string&
    file_name () const noexcept { return file_name_; }

    const std::string&
    target_path () const noexcept { return target_path_; }

    std::uint64_t
    size_bytes () const noexcept { return size_bytes_; }

    download_status
    status () const noexcept { return status_; }

    std::int32_t
    priority () const noexcept { return priority_; }

    double
    progress_percent () const noexcept { return progress_percent_; }

    double
    throughput_bps () const noexcept { return throughput_bps_; }

    const std::string&
    error () const noexcept { return error_; }

    std::int64_t
    created_at () const noexcept { return created_at_; }

    std::int64_t
    updated_at () const noexcept { return updated_at_; }

    std::int64_t
    started_at () const noexcept { return started_at_; }

    // Mutators.
    //
    void
    set_identity (const content_identity& c)
    {
      file_id_ = c.file_id;
      access_token_ = c.access_token;
    }

    void
    set_file_name (std::string n) { file_name_ = std::move (n); }

    void
    set_target_path (std::string p) { target_path_ = std::move (p); }

    void
    set_size_bytes (std::uint64_t n) { size_bytes_ = n; }

    void
    set_status (download_status s) { status_ = s; }

    void
    set_priority (std::int32_t p) { priority_ = p; }

    void
    set_progress_percent (double p) { progress_percent_ = p; }

    void
    set_throughput_bps (double t) { throughput_bps_ = t; }

    void
    set_error (std::string e) { error_ = std::move (e); }

    void
    set_created_at (std::int64_t t) { created_at_ = t; }

    void
    set_updated_at (std::int64_t t) { updated_at_ = t; }

    void
    set_started_at (std::int64_t t) { started_at_ = t; }

  private:
    friend class odb::access;
    friend class memory_record_store;

    record_id id_ {0};

    download_origin origin_ {download_origin::direct};
    origin_ref origin_ref_;

    // Content identity, both empty when the transport exposes none.
    //
    std::string file_id_;
    std::string access_token_;

    std::string file_name_;
    std::string target_path_;
    std::uint64_t size_bytes_ {0};

    download_status status_ {download_status::pending};
    std::int32_t priority_ {0};

    double progress_percent_ {0.0};
    double throughput_bps_ {0.0};

    std::string error_;

    std::int64_t created_at_ {0};
    std::int64_t updated_at_ {0};
    std::int64_t started_at_ {0};
  };

  std::ostream&
  operator<< (std::ostream&, const download_record&);
}
