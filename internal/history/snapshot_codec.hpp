#pragma once

#include <string>
#include <vector>

#include "archstore/v1/snapshot.pb.h"
#include "internal/db/model/record.hpp"
#include "internal/util/time.hpp"

namespace archstore::history {

struct SnapshotMetadata {
  util::TimePoint created_at;
  std::string     app_version;
  std::string     schema_version;
};

/*
  ProjectSnapshotPayload <-> records.

  Encoding is deterministic: fields are name-ordered, children are sorted
  by id, relationships keep their stored order. The checksum of a version
  is taken over exactly the bytes EncodeProjectSnapshot returns.
*/
std::string EncodeProjectSnapshot(const db::model::Record& project, std::vector<db::model::Record> children, const SnapshotMetadata& metadata);

// Throws CorruptionError if the payload is not a snapshot document.
archstore::v1::ProjectSnapshotPayload ParseProjectSnapshot(const std::string& payload);

// Project record first, then the children in payload order.
std::vector<db::model::Record> RecordsFromSnapshot(const archstore::v1::ProjectSnapshotPayload& snapshot);

archstore::v1::FieldValue ToProto(const db::model::FieldValue& value);
db::model::FieldValue     FromProto(const archstore::v1::FieldValue& value);

} // namespace archstore::history
