#include <tdm/admission/admission-controller.hxx>

using namespace std;

namespace tdm
{
  string
  to_string (victim_policy p)
  {
    switch (p)
    {
      case victim_policy::oldest_started:  return "oldest-started";
      case victim_policy::lowest_priority: return "lowest-priority";
    }
    return "unknown";
  }

  optional<victim_policy>
  to_victim_policy (const string& s)
  {
    if (s == "oldest-started")  return victim_policy::oldest_started;
    if (s == "lowest-priority") return victim_policy::lowest_priority;
    return nullopt;
  }
}
