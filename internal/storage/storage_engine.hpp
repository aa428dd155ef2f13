#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/model/schema.hpp"
#include "internal/storage/record_validator.hpp"
#include "internal/storage/working_context.hpp"
#include "internal/sync/remote_sync.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace archstore::storage {

enum class ConflictPolicy {
  kLastWriterWins,
  kStoreWins,
  kSurfaceConflict,
};

ConflictPolicy FromConfig(archstore::runtime::config::ConflictPolicy policy);
const char*    ConflictPolicyName(ConflictPolicy policy);

struct EngineOptions {
  ConflictPolicy conflict_policy = ConflictPolicy::kLastWriterWins;
  util::ClockFn  clock           = util::Now;
};

using events::CommitOrigin;
using events::CommitSummary;

using AtomicOperation = std::function<void(WorkingContext&)>;

/*
  Owns the durable record graph.

  Commits from all contexts are serialized on one mutex and applied in one
  SQLite write transaction each. Lock order is commit mutex, then context
  mutex, then the connection's transaction mutex; contexts are merged only
  after the transaction ends.

  Conflicts: a pending update whose baseline revision is older than the
  durable row is merged field by field. Fields changed only on one side
  merge silently; fields changed on both sides follow the ConflictPolicy.
  A pending update of a row deleted by another commit is dropped.
*/
class StorageEngine {
 public:
  StorageEngine(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<db::Repository> repository,
                std::shared_ptr<const model::SchemaModel> schema, std::shared_ptr<events::EventBus> bus, EngineOptions options = {});

  std::shared_ptr<WorkingContext> OpenContext(Isolation isolation);

  // Single auto-merging context for interactive use.
  std::shared_ptr<WorkingContext> ViewContext() const {
    return view_;
  }

  // Fresh id, schema defaults. project_id is ignored for projects and
  // catalog records.
  db::model::Record NewRecord(const std::string& entity, const std::string& project_id = {}) const;

  CommitSummary Commit(const std::shared_ptr<WorkingContext>& context, CommitOrigin origin = CommitOrigin::kLocal);

  // Runs operations then commits; on any failure the context is rolled back
  // to its state before the call and the error is rethrown.
  CommitSummary RunAtomic(const std::shared_ptr<WorkingContext>& context, const std::vector<AtomicOperation>& operations);
  CommitSummary RunAtomic(const std::shared_ptr<WorkingContext>& context, const AtomicOperation& operation);

  // Set-based; contexts are refreshed afterwards. Returns affected ids.
  std::vector<std::string> BatchUpdate(const db::RecordQuery& query, const db::model::FieldMap& assignments);
  std::vector<std::string> BatchDelete(const db::RecordQuery& query);

  CommitSummary ApplyExternalChanges(const sync::ExternalChangeSet& changes);

  // fn runs inside a write transaction under the commit mutex.
  void RunSerialized(const std::function<void(db::Repository&, db::Transaction&)>& fn);

  // fn runs inside a read transaction.
  void RunRead(const std::function<void(db::Repository&, db::Transaction&)>& fn) const;

  void Checkpoint();
  void Close();

  bool Failed() const {
    return failed_.load();
  }

  uint64_t LastSequence() const {
    return sequence_.load();
  }

  const model::SchemaModel& Schema() const {
    return *schema_;
  }

  const std::string& Path() const {
    return db_->Path();
  }

  ConflictPolicy Policy() const {
    return options_.conflict_policy;
  }

  const std::shared_ptr<events::EventBus>& Bus() const {
    return bus_;
  }

  const util::ClockFn& Clock() const {
    return options_.clock;
  }

 private:
  struct Staged {
    std::vector<db::model::Record> written;
    std::vector<std::string>       removed;
    CommitSummary                  summary;
  };

  void              RequireOpen() const;
  Staged            StageCommit(WorkingContext& context, db::Transaction& tx, uint64_t now_ms);
  db::model::Record ResolveConflict(const WorkingContext::Tracked& local, const db::model::Record& durable, uint32_t& conflicts);
  void              MarkFailedIfFatal(const util::StoreError& error);
  void              RefreshContexts();
  void              Publish(const CommitSummary& summary);

  std::shared_ptr<db::sqlite::SqliteDB>     db_;
  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<const model::SchemaModel> schema_;
  std::shared_ptr<events::EventBus>         bus_;
  EngineOptions                             options_;
  RecordValidator                           validator_;

  std::mutex commit_mutex_;

  mutable std::mutex                         contexts_mutex_;
  std::vector<std::weak_ptr<WorkingContext>> contexts_;
  std::atomic<uint64_t>                      next_context_id_{1};
  std::shared_ptr<WorkingContext>            view_;

  std::atomic<uint64_t> sequence_{0};
  std::atomic<bool>     failed_{false};
  std::atomic<bool>     closed_{false};
};

} // namespace archstore::storage
