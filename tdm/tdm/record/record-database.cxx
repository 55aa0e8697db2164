#include <tdm/record/record-database.hxx>

namespace tdm
{
  template class basic_record_database<record_database_traits<>>;
}
