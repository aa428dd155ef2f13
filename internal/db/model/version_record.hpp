#pragma once

#include <cstdint>
#include <string>

#include "archstore/v1/snapshot.pb.h"

namespace archstore::db::model {

/*
  Persistent version snapshot row.

  Immutable after insert apart from checksum repair. payload holds the
  exact bytes the checksum was computed over.
*/
struct VersionRecord {
  std::string id;
  std::string project_id;

  // Strictly increasing per project, never reused.
  uint64_t version_number = 0;

  archstore::v1::VersionType type = archstore::v1::VERSION_TYPE_AUTOMATIC;

  std::string comment;
  std::string author;
  uint64_t    created_at_ms = 0;
  uint64_t    data_size     = 0;

  std::string payload;
  std::string checksum;
};

}
