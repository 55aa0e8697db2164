#include <iostream>
#include <string>
#include <system_error>

#include <tdm/fetch/filename-template.hxx>
#include <tdm/record/record-query.hxx>

namespace tdm
{
  template <typename T>
  basic_download_service<T>::
  basic_download_service (boost::asio::io_context& ioc,
                          store_type& s,
                          transport_type& x,
                          download_service_config c)
    : store_ (s),
      config_ (std::move (c)),
      controller_ (s, registry_, config_.max_concurrent, config_.victim),
      index_ (s),
      direct_ (ioc, s, x, controller_, registry_, config_.notify_interval),
      rule_ (ioc, s, x, controller_, registry_, config_.notify_interval),
      router_ (direct_, rule_),
      recovery_ (s,
                 controller_,
                 registry_,
                 [this] (const download_record& r) {return router_.restore (r);})
  {
    controller_.set_dispatch (
      [this] (const download_record& r) {router_.restore (r);});
  }

  template <typename T>
  void basic_download_service<T>::
  on_progress (progress_function f)
  {
    direct_.on_progress (f);
    rule_.on_progress (std::move (f));
  }

  template <typename T>
  void basic_download_service<T>::
  on_finish (finish_function f)
  {
    direct_.on_finish (f);
    rule_.on_finish (std::move (f));
  }

  template <typename T>
  recovery_report basic_download_service<T>::
  recover ()
  {
    return recovery_.recover ();
  }

  template <typename T>
  fs::path basic_download_service<T>::
  target_path (const download_candidate& c, record_id id) const
  {
    if (c.origin == download_origin::direct)
    {
      std::string n (c.file_name.empty ()
                     ? "file_" + std::to_string (c.ref.message_id)
                     : sanitize_path_component (c.file_name));

      return config_.download_dir / n;
    }

    filename_context x;
    x.task_id = id;
    x.message_id = c.ref.message_id;
    x.chat_title = c.chat_title;
    x.timestamp = current_timestamp_us () / 1000000;
    x.file_name = c.file_name;

    fs::path d (c.save_dir.empty () ? config_.download_dir : fs::path (c.save_dir));
    return d / expand_filename_template (c.filename_template, x);
  }

  template <typename T>
  submit_result basic_download_service<T>::
  submit (const download_candidate& c, std::optional<source_type> s)
  {
    // Only a completed download of the same content counts. Checked once,
    // here: an identical candidate in flight is not a duplicate.
    //
    if (c.identity)
    {
      if (std::optional<download_record> d = index_.find_completed (*c.identity))
        return submit_result {submit_status::duplicate, d->id ()};
    }

    download_record r (c.origin, c.ref, c.file_name, c.size_bytes, c.priority);

    if (c.identity)
      r.set_identity (*c.identity);

    record_id id (store_.insert (r));

    record_patch p;
    p.target_path = target_path (c, id).string ();
    store_.update (id, p);

    if (!controller_.try_admit (id))
      return submit_result {submit_status::queued, id};

    std::optional<download_record> a (store_.find (id));

    if (a)
    {
      if (s)
        router_.start (*a, std::move (*s));
      else
        router_.restore (*a);
    }

    return submit_result {submit_status::started, id};
  }

  template <typename T>
  bool basic_download_service<T>::
  dispatch (record_id id)
  {
    std::optional<download_record> r (store_.find (id));
    return r && router_.restore (*r);
  }

  template <typename T>
  operation_result basic_download_service<T>::
  pause (record_id id)
  {
    std::optional<download_record> r (store_.find (id));

    if (!r)
      return operation_result::not_found (id);

    switch (r->status ())
    {
    case download_status::paused:
      return operation_result::ok ("already paused");

    case download_status::queued:
    case download_status::pending:
      {
        if (controller_.withdraw (id,
                                  download_status::paused,
                                  to_string (cancel_reason::pause)))
          return operation_result::ok ("paused");

        // Promoted in the meantime.
        //
        break;
      }

    case download_status::downloading:
      break;

    default:
      return operation_result::rejected (
        "download " + std::to_string (id) + " is " + to_string (r->status ()));
    }

    if (registry_.request_cancel (id, cancel_reason::pause))
      return operation_result::ok ("pausing");

    return operation_result::rejected (
      "download " + std::to_string (id) + " is not running");
  }

  template <typename T>
  operation_result basic_download_service<T>::
  resume (record_id id)
  {
    std::optional<download_record> r (store_.find (id));

    if (!r)
      return operation_result::not_found (id);

    switch (r->status ())
    {
    case download_status::paused:
      break;

    case download_status::failed:
      return operation_result::rejected (
        "download " + std::to_string (id) +
        " failed and is not retried, submit it again");

    default:
      return operation_result::rejected (
        "download " + std::to_string (id) + " is " + to_string (r->status ()));
    }

    record_patch p;
    p.error = std::string ();
    store_.update (id, p);

    if (!controller_.try_admit (id))
      return operation_result::ok ("queued");

    dispatch (id);
    return operation_result::ok ("resumed");
  }

  template <typename T>
  operation_result basic_download_service<T>::
  cancel (record_id id)
  {
    std::optional<download_record> r (store_.find (id));

    if (!r)
      return operation_result::not_found (id);

    const std::string reason (to_string (cancel_reason::cancel));

    switch (r->status ())
    {
    case download_status::queued:
    case download_status::pending:
      {
        if (controller_.withdraw (id, download_status::cancelled, reason))
          return operation_result::ok ("cancelled");

        break;
      }

    case download_status::paused:
      {
        record_patch p;
        p.status = download_status::cancelled;
        p.error = reason;
        store_.update (id, p);

        return operation_result::ok ("cancelled");
      }

    case download_status::downloading:
      break;

    default:
      return operation_result::rejected (
        "download " + std::to_string (id) + " is " + to_string (r->status ()));
    }

    if (registry_.request_cancel (id, cancel_reason::cancel))
      return operation_result::ok ("cancelling");

    return operation_result::rejected (
      "download " + std::to_string (id) + " is not running");
  }

  template <typename T>
  operation_result basic_download_service<T>::
  set_priority (record_id id, std::int32_t v)
  {
    std::optional<download_record> r (store_.find (id));

    if (!r)
      return operation_result::not_found (id);

    record_patch p;
    p.priority = v;
    store_.update (id, p);

    // Only a raise above the threshold competes for a slot.
    //
    if (v <= config_.preempt_threshold || v <= r->priority ())
      return operation_result::ok ("priority set");

    switch (r->status ())
    {
    case download_status::queued:
    case download_status::pending:
      {
        if (controller_.try_admit (id))
        {
          dispatch (id);
          return operation_result::ok ("started");
        }

        break;
      }

    case download_status::downloading:
      break;

    default:
      return operation_result::ok ("priority set");
    }

    if (std::optional<record_id> x = controller_.preempt (id))
      return operation_result::ok ("preempting download " +
                                   std::to_string (*x));

    return operation_result::ok ("priority set");
  }

  template <typename T>
  operation_result basic_download_service<T>::
  erase (record_id id)
  {
    std::optional<download_record> r (store_.find (id));

    if (!r)
      return operation_result::not_found (id);

    bool running (r->status () == download_status::downloading);

    // The exit path of a running transfer sees the erase reason and leaves
    // the record and the slot to us.
    //
    if (running)
      registry_.request_cancel (id, cancel_reason::erase);

    if (!r->target_path ().empty ())
    {
      std::error_code ec;
      if (!fs::remove (r->target_path (), ec) && ec)
        std::cerr << "warning: unable to remove " << r->target_path ()
                  << ": " << ec.message () << std::endl;
    }

    store_.erase (id);

    if (running)
      controller_.on_finished (id);

    return operation_result::ok ("deleted");
  }

  template <typename T>
  std::vector<download_record> basic_download_service<T>::
  list (std::size_t limit) const
  {
    record_filter f;
    f.order = record_order::newest_first;
    f.limit = limit;

    return store_.list (f);
  }
}
