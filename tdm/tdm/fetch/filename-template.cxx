#include <tdm/fetch/filename-template.hxx>

#include <algorithm>

using namespace std;

namespace tdm
{
  const char* const default_filename_template = "{message_id}_{file_name}";

  string
  sanitize_path_component (string s)
  {
    replace (s.begin (), s.end (), '/', '_');
    replace (s.begin (), s.end (), '\\', '_');
    return s;
  }

  static void
  substitute (string& s, const string& var, const string& value)
  {
    for (size_t p (s.find (var)); p != string::npos;
         p = s.find (var, p + value.size ()))
      s.replace (p, var.size (), value);
  }

  string
  expand_filename_template (const string& t, const filename_context& c)
  {
    string original (c.file_name.empty ()
                     ? "file_" + std::to_string (c.message_id)
                     : sanitize_path_component (c.file_name));

    string r (t.empty () ? string (default_filename_template) : t);

    substitute (r, "{task_id}", std::to_string (c.task_id));
    substitute (r, "{message_id}", std::to_string (c.message_id));
    substitute (r, "{chat_title}", sanitize_path_component (c.chat_title));
    substitute (r, "{timestamp}", std::to_string (c.timestamp));
    substitute (r, "{file_name}", original);

    size_t d (original.rfind ('.'));
    if (d != string::npos && r.find ('.') == string::npos)
      r += original.substr (d);

    return r;
  }
}
