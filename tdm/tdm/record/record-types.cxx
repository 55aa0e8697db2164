#include <tdm/record/record-types.hxx>

#include <chrono>

using namespace std;

namespace tdm
{
  string
  to_string (download_status s)
  {
    switch (s)
    {
      case download_status::pending:     return "pending";
      case download_status::queued:      return "queued";
      case download_status::downloading: return "downloading";
      case download_status::paused:      return "paused";
      case download_status::completed:   return "completed";
      case download_status::failed:      return "failed";
      case download_status::cancelled:   return "cancelled";
    }
    return "unknown";
  }

  optional<download_status>
  to_download_status (const string& s)
  {
    if (s == "pending")     return download_status::pending;
    if (s == "queued")      return download_status::queued;
    if (s == "downloading") return download_status::downloading;
    if (s == "paused")      return download_status::paused;
    if (s == "completed")   return download_status::completed;
    if (s == "failed")      return download_status::failed;
    if (s == "cancelled")   return download_status::cancelled;
    return nullopt;
  }

  string
  to_string (download_origin o)
  {
    switch (o)
    {
      case download_origin::direct: return "direct";
      case download_origin::rule:   return "rule";
    }
    return "unknown";
  }

  optional<download_origin>
  to_download_origin (const string& s)
  {
    if (s == "direct") return download_origin::direct;
    if (s == "rule")   return download_origin::rule;
    return nullopt;
  }

  int64_t
  current_timestamp_us ()
  {
    using namespace chrono;

    return duration_cast<microseconds> (
      system_clock::now ().time_since_epoch ()).count ();
  }

  ostream&
  operator<< (ostream& o, const download_record& r)
  {
    o << '#' << r.id () << ' ' << r.origin () << ' ' << r.ref () << ' '
      << r.status () << " '" << r.file_name () << "'";

    if (r.priority () != 0)
      o << " priority " << r.priority ();

    if (!r.error ().empty ())
      o << " (" << r.error () << ')';

    return o;
  }
}
