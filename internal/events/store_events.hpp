#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "archstore/v1/snapshot.pb.h"

namespace archstore::events {

enum class CommitOrigin {
  kLocal,
  kRemote,
};

inline const char* CommitOriginName(CommitOrigin origin) {
  return origin == CommitOrigin::kRemote ? "remote" : "local";
}

// Published after every durable commit, local or remote.
struct CommitSummary {
  uint64_t     sequence = 0;
  CommitOrigin origin   = CommitOrigin::kLocal;

  std::vector<std::string> inserted;
  std::vector<std::string> updated;
  std::vector<std::string> deleted;

  // project id -> number of record changes in this commit
  std::map<std::string, uint64_t> changes_by_project;

  uint32_t conflicts_resolved = 0;
  uint64_t committed_at_ms    = 0;

  bool Empty() const {
    return inserted.empty() && updated.empty() && deleted.empty();
  }

  uint64_t TotalChanges() const {
    return inserted.size() + updated.size() + deleted.size();
  }
};

struct MigrationEvent {
  std::string state;
  double      progress = 0.0;
  std::string from_version;
  std::string to_version;
};

struct IntegrityEvent {
  double   score        = 1.0;
  uint32_t total_issues = 0;
  uint32_t critical     = 0;
  bool     quick        = false;
};

struct VersionEvent {
  enum class Action {
    kCreated,
    kRestored,
    kDeleted,
    kPruned,
  };

  Action                     action = Action::kCreated;
  std::string                project_id;
  uint64_t                   version_number = 0;
  archstore::v1::VersionType type           = archstore::v1::VERSION_TYPE_AUTOMATIC;
};

} // namespace archstore::events
