#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/record_query.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/record.hpp"

namespace archstore::storage {

class StorageEngine;
class WorkingContext;

enum class Isolation {
  kDefault,     // interactive view; auto-merges other commits
  kBackground,  // isolated until it commits
  kReadOnly,
};

const char* IsolationName(Isolation isolation);

struct ChangeSet {
  std::vector<std::string> inserted;
  std::vector<std::string> updated;
  std::vector<std::string> deleted;

  std::size_t Total() const {
    return inserted.size() + updated.size() + deleted.size();
  }
};

/*
  Capture of a context's pending changes.

  Holds the pending inserts by value, the changed fields of each pending
  update and the pending deletes. Valid only for the context that produced
  it; RollbackTo and Release consume it.
*/
class Savepoint {
 public:
  Savepoint(Savepoint&& other) noexcept;
  Savepoint& operator=(Savepoint&& other) noexcept;

  Savepoint(const Savepoint&)            = delete;
  Savepoint& operator=(const Savepoint&) = delete;

  uint64_t ContextId() const {
    return context_id_;
  }

  bool Valid() const {
    return valid_;
  }

 private:
  friend class WorkingContext;

  Savepoint() = default;

  struct FieldChanges {
    // nullopt: field absent before the block
    std::map<std::string, std::optional<db::model::FieldValue>> fields;
    std::string                                                 project_id;
    std::vector<db::model::Relationship>                        relationships;
  };

  uint64_t context_id_ = 0;
  bool     valid_      = false;

  std::map<std::string, db::model::Record> inserted_;
  std::map<std::string, FieldChanges>      updated_;
  std::set<std::string>                    deleted_;
};

/*
  Isolated mutable view over the durable record graph.

  Records read through the context are cached; mutations are tracked until
  StorageEngine::Commit makes them durable. Methods are thread safe; one
  context should still have one logical writer.
*/
class WorkingContext {
 public:
  WorkingContext(uint64_t id, Isolation isolation, std::shared_ptr<db::Repository> repository);

  WorkingContext(const WorkingContext&)            = delete;
  WorkingContext& operator=(const WorkingContext&) = delete;

  uint64_t Id() const {
    return id_;
  }

  Isolation GetIsolation() const {
    return isolation_;
  }

  std::optional<db::model::Record> Get(const std::string& id);

  // Durable matches merged with pending changes, ordered by id.
  std::vector<db::model::Record> Fetch(const db::RecordQuery& query);

  void Insert(db::model::Record record);
  void Update(db::model::Record record);
  void SetField(const std::string& id, const std::string& field, db::model::FieldValue value);
  void SetRelationships(const std::string& id, std::vector<db::model::Relationship> relationships);

  // Deleting a project also deletes its child records.
  void Delete(const std::string& id);

  bool      HasChanges() const;
  ChangeSet PendingChanges() const;

  // Discards every pending change.
  void Reset();

  // Drops cached clean records so the next read sees durable state.
  void Refresh();

  Savepoint CreateSavepoint() const;
  void      RollbackTo(Savepoint savepoint);
  void      Release(Savepoint savepoint);

 private:
  friend class StorageEngine;

  struct Tracked {
    std::optional<db::model::Record> baseline;  // durable state when loaded
    db::model::Record                current;
    bool                             inserted = false;
    bool                             deleted  = false;

    bool Dirty() const {
      return inserted || deleted || !baseline || !current.SameContent(*baseline);
    }
  };

  void                             RequireWritable() const;
  Tracked*                         LoadLocked(const std::string& id);
  Tracked&                         RequireLiveLocked(const std::string& id);
  void                             DeleteLocked(const std::string& id);
  std::vector<std::string>         DurableIds(const db::RecordQuery& query);
  void                             CheckSavepoint(const Savepoint& savepoint) const;

  // Called by the engine with mutex_ held.
  void MarkCommittedLocked(const std::vector<db::model::Record>& written, const std::vector<std::string>& removed);
  void MergeCommitted(const ChangeSet& changes);

  const uint64_t                  id_;
  const Isolation                 isolation_;
  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex             mutex_;
  std::map<std::string, Tracked> objects_;
};

} // namespace archstore::storage
