#pragma once

// Persistence mapping for the record types.
//
// Only the ODB compiler sees this file: it is passed as the epilogue when
// compiling record-types.hxx, so the types themselves stay free of the ODB
// runtime.
//
#include <tdm/record/record-types.hxx>

namespace tdm
{
  #pragma db value(origin_ref)

  #pragma db object(download_record) table("downloads")

  #pragma db member(download_record::id_) id auto

  #pragma db member(download_record::origin_) not_null
  #pragma db member(download_record::origin_ref_) column("origin_")

  #pragma db member(download_record::file_id_) index
  #pragma db member(download_record::file_name_) not_null

  #pragma db member(download_record::status_) not_null index
  #pragma db member(download_record::priority_) not_null

  #pragma db member(download_record::created_at_) not_null
  #pragma db member(download_record::updated_at_) not_null
}
