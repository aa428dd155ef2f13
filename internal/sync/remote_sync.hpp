#pragma once

#include <string>
#include <vector>

#include "internal/db/model/record.hpp"

namespace archstore::sync {

/*
  Seams for an external replication layer.

  The store never talks to the network. A sync layer subscribes to
  EventBus::commits for local changes and hands remote changes to
  StorageEngine::ApplyExternalChanges so they take the normal commit path.
*/

// One remote change. Upserts carry the full record; deletes only the id.
struct ExternalChange {
  enum class Kind {
    kUpsert,
    kDelete,
  };

  Kind              kind = Kind::kUpsert;
  db::model::Record record;
  std::string       record_id;

  static ExternalChange Upsert(db::model::Record record) {
    ExternalChange change;
    change.kind      = Kind::kUpsert;
    change.record_id = record.id;
    change.record    = std::move(record);
    return change;
  }

  static ExternalChange Delete(std::string id) {
    ExternalChange change;
    change.kind      = Kind::kDelete;
    change.record_id = std::move(id);
    return change;
  }
};

using ExternalChangeSet = std::vector<ExternalChange>;

// Reachability check consulted by the integrity health check.
class RemoteSyncStatus {
 public:
  virtual ~RemoteSyncStatus() = default;

  virtual bool IsReachable() = 0;

  virtual std::string Describe() const {
    return "remote sync";
  }
};

} // namespace archstore::sync
