#include <tdm/cancel/cancel-registry.hxx>

using namespace std;

namespace tdm
{
  string
  to_string (cancel_reason r)
  {
    switch (r)
    {
      case cancel_reason::pause:   return "paused";
      case cancel_reason::preempt: return "preempted";
      case cancel_reason::cancel:  return "cancelled";
      case cancel_reason::erase:   return "erased";
    }
    return "unknown";
  }

  shared_ptr<cancel_token> cancel_registry::
  enroll (record_id id)
  {
    lock_guard<mutex> l (mutex_);

    if (entries_.find (id) != entries_.end ())
      return nullptr;

    shared_ptr<cancel_token> t (make_shared<cancel_token> ());
    entries_.emplace (id, entry {t, nullptr});
    return t;
  }

  bool cancel_registry::
  attach (record_id id, interrupt_function f)
  {
    lock_guard<mutex> l (mutex_);

    auto i (entries_.find (id));
    if (i == entries_.end ())
      return false;

    i->second.interrupt = move (f);
    return true;
  }

  bool cancel_registry::
  request_cancel (record_id id, cancel_reason r)
  {
    interrupt_function f;
    {
      lock_guard<mutex> l (mutex_);

      auto i (entries_.find (id));
      if (i == entries_.end ())
        return false;

      i->second.token->request (r);
      f = i->second.interrupt;
    }

    // The handle may call back into the transport, which must not run under
    // our lock.
    //
    if (f)
      f ();

    return true;
  }

  optional<cancel_reason> cancel_registry::
  requested (record_id id) const
  {
    lock_guard<mutex> l (mutex_);

    auto i (entries_.find (id));
    if (i == entries_.end () || !i->second.token->requested ())
      return nullopt;

    return i->second.token->reason ();
  }

  bool cancel_registry::
  contains (record_id id) const
  {
    lock_guard<mutex> l (mutex_);
    return entries_.find (id) != entries_.end ();
  }

  void cancel_registry::
  clear (record_id id)
  {
    lock_guard<mutex> l (mutex_);
    entries_.erase (id);
  }

  size_t cancel_registry::
  size () const
  {
    lock_guard<mutex> l (mutex_);
    return entries_.size ();
  }
}
