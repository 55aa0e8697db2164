#pragma once

#include <cstdint>
#include <string>

namespace tdm
{
  // Values substituted into a rule's file name template.
  //
  struct filename_context
  {
    std::uint64_t task_id {0};
    std::int64_t message_id {0};
    std::string chat_title;
    std::int64_t timestamp {0}; // Seconds since the epoch.
    std::string file_name;
  };

  // Used when a rule does not specify one.
  //
  extern const char* const default_filename_template;

  // Replace path separators so that the value stays one path component.
  //
  std::string
  sanitize_path_component (std::string);

  // Expand {task_id}, {message_id}, {chat_title}, {timestamp} and
  // {file_name}. If the original name has an extension and the result has
  // none, the extension is appended. An empty original name becomes
  // file_<message_id>.
  //
  std::string
  expand_filename_template (const std::string& tmpl, const filename_context&);
}
