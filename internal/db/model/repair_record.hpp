#pragma once

#include <cstdint>
#include <string>

#include "archstore/v1/integrity.pb.h"

namespace archstore::db::model {

// Audit row appended after every integrity repair pass.
struct RepairRecord {
  std::string id;
  uint64_t    performed_at_ms = 0;
  uint32_t    attempted       = 0;
  uint32_t    repaired        = 0;
  uint32_t    failed          = 0;
  uint64_t    duration_ms     = 0;

  archstore::v1::RepairType type = archstore::v1::REPAIR_TYPE_AUTOMATIC;
};

}
