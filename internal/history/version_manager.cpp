#include "version_manager.hpp"

#include <set>

#include "internal/history/snapshot_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace archstore::history {

using archstore::v1::VersionInfo;
using archstore::v1::VersionType;
using db::model::Record;
using db::model::VersionRecord;

archstore::v1::VersionInfo ToVersionInfo(const VersionRecord& record) {
  VersionInfo info;
  info.set_id(record.id);
  info.set_project_id(record.project_id);
  info.set_version_number(record.version_number);
  info.set_type(record.type);
  info.set_comment(record.comment);
  info.set_author(record.author);
  *info.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  info.set_data_size(record.data_size);
  info.set_checksum(record.checksum);
  return info;
}

const char* VersionTypeName(VersionType type) {
  switch (type) {
    case archstore::v1::VERSION_TYPE_AUTOMATIC:
      return "automatic";
    case archstore::v1::VERSION_TYPE_MANUAL:
      return "manual";
    case archstore::v1::VERSION_TYPE_BEFORE_RESTORE:
      return "beforeRestore";
    case archstore::v1::VERSION_TYPE_BEFORE_MIGRATION:
      return "beforeMigration";
    case archstore::v1::VERSION_TYPE_CHECKPOINT:
      return "checkpoint";
    default:
      return "unknown";
  }
}

VersionManager::VersionManager(std::shared_ptr<storage::StorageEngine> engine, std::shared_ptr<const model::SchemaCatalog> catalog,
                               std::shared_ptr<const migration::MigrationRegistry> registry, VersionOptions options)
    : engine_(std::move(engine)), catalog_(std::move(catalog)), registry_(std::move(registry)), options_(std::move(options)) {
}

VersionInfo VersionManager::CreateVersion(const std::string& project_id, VersionType type, const std::string& comment) {
  observability::SpanScope span("archstore.version.create");
  span.SetAttribute("project_id", project_id);
  span.SetAttribute("type", VersionTypeName(type));

  const auto                 now = engine_->Clock()();
  VersionRecord              record;
  std::vector<VersionRecord> pruned;

  engine_->RunSerialized([&](db::Repository& repo, db::Transaction& tx) {
    auto project = repo.GetRecord(tx, project_id);
    if (!project || project->entity != model::kProjectEntity) throw util::NotFound("project " + project_id + " does not exist");

    if (type == archstore::v1::VERSION_TYPE_AUTOMATIC && options_.min_auto_interval.count() > 0) {
      const auto existing = repo.ListVersions(tx, project_id);
      for (auto it = existing.rbegin(); it != existing.rend(); ++it) {
        if (it->type != archstore::v1::VERSION_TYPE_AUTOMATIC) continue;
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - util::FromUnixMillis(it->created_at_ms));
        if (elapsed < options_.min_auto_interval) {
          throw util::TooFrequent("automatic version of project " + project_id + " requested " + std::to_string(elapsed.count()) +
                                  "ms after version " + std::to_string(it->version_number));
        }
        break;
      }
    }

    auto children = repo.ListRecords(tx, db::RecordQuery::ForProject(project_id));
    std::erase_if(children, [&](const Record& child) { return child.id == project_id; });

    record.id             = util::NewId();
    record.project_id     = project_id;
    record.version_number = repo.LastVersionNumber(tx, project_id) + 1;
    record.type           = type;
    record.comment        = comment;
    record.author         = options_.author;
    record.created_at_ms  = util::ToUnixMillis(now);
    record.payload        = EncodeProjectSnapshot(*project, std::move(children), {now, options_.app_version, engine_->Schema().version});
    record.data_size      = record.payload.size();
    record.checksum       = util::Sha256Hex(record.payload);

    db::ThrowIfError(repo.InsertVersion(tx, record), "insert version of project " + project_id);
    ApplyRetention(repo, tx, project_id, pruned);
  });

  ARCHSTORE_LOG_INFO("version created", {observability::StringField("project_id", project_id),
                                         observability::IntField("version", static_cast<std::int64_t>(record.version_number)),
                                         observability::StringField("type", VersionTypeName(type)),
                                         observability::IntField("bytes", static_cast<std::int64_t>(record.data_size))});
  Publish(events::VersionEvent::Action::kCreated, record);

  for (const auto& old : pruned) {
    ARCHSTORE_LOG_INFO("version pruned", {observability::StringField("project_id", project_id),
                                          observability::IntField("version", static_cast<std::int64_t>(old.version_number)),
                                          observability::StringField("type", VersionTypeName(old.type))});
    Publish(events::VersionEvent::Action::kPruned, old);
  }
  return ToVersionInfo(record);
}

void VersionManager::ApplyRetention(db::Repository& repo, db::Transaction& tx, const std::string& project_id,
                                    std::vector<VersionRecord>& pruned) const {
  if (options_.max_versions == 0) return;

  auto versions = repo.ListVersions(tx, project_id);
  if (versions.size() <= options_.max_versions) return;

  auto excess = versions.size() - options_.max_versions;
  for (auto& version : versions) {
    if (excess == 0) break;
    if (version.type == archstore::v1::VERSION_TYPE_MANUAL) continue;
    db::ThrowIfError(repo.DeleteVersion(tx, version.id), "prune version " + version.id);
    pruned.push_back(std::move(version));
    --excess;
  }
}

VersionInfo VersionManager::SaveManually(const std::string& project_id, const std::string& comment) {
  auto view = engine_->ViewContext();
  if (view->HasChanges()) engine_->Commit(view);
  return CreateVersion(project_id, archstore::v1::VERSION_TYPE_MANUAL, comment);
}

VersionInfo VersionManager::RestoreVersion(const VersionInfo& snapshot, const std::string& project_id) {
  observability::SpanScope span("archstore.version.restore");
  span.SetAttribute("project_id", project_id);
  span.SetAttribute("version", static_cast<std::int64_t>(snapshot.version_number()));

  const auto record = LoadRecord(snapshot.id());
  if (record.project_id != project_id) {
    throw util::InvalidState("version " + record.id + " belongs to project " + record.project_id + ", not " + project_id);
  }
  if (!util::VerifyChecksum(record.payload, record.checksum)) {
    span.RecordException("checksum mismatch");
    ARCHSTORE_LOG_ERROR("version checksum mismatch", {observability::StringField("project_id", project_id),
                                                      observability::IntField("version", static_cast<std::int64_t>(record.version_number))});
    throw util::CorruptionError("corrupted version data: version " + std::to_string(record.version_number) + " of project " + project_id);
  }

  const auto payload = ParseProjectSnapshot(record.payload);
  auto       records = RecordsFromSnapshot(payload);

  const auto& stored_schema  = payload.metadata().schema_version();
  const auto& current_schema = engine_->Schema().version;
  if (!stored_schema.empty() && stored_schema != current_schema) {
    records = registry_->MapRecords(std::move(records), stored_schema, current_schema, *catalog_);
  }

  std::set<std::string> keep;
  for (const auto& restored : records) keep.insert(restored.id);
  if (!keep.contains(project_id)) throw util::CorruptionError("version " + record.id + " does not contain project " + project_id);

  auto safety = CreateVersion(project_id, archstore::v1::VERSION_TYPE_BEFORE_RESTORE,
                              "Before restoring version " + std::to_string(record.version_number));

  auto context = engine_->OpenContext(storage::Isolation::kBackground);
  engine_->RunAtomic(context, [&](storage::WorkingContext& ctx) {
    for (const auto& live : ctx.Fetch(db::RecordQuery::ForProject(project_id))) {
      if (!keep.contains(live.id)) ctx.Delete(live.id);
    }
    for (const auto& restored : records) {
      auto existing = ctx.Get(restored.id);
      if (!existing) {
        ctx.Insert(restored);
        continue;
      }
      if (existing->entity != restored.entity) {
        throw util::InvalidState("record " + restored.id + " changed entity since version " + std::to_string(record.version_number));
      }
      existing->project_id    = restored.project_id;
      existing->fields        = restored.fields;
      existing->relationships = restored.relationships;
      ctx.Update(std::move(*existing));
    }
  });

  ARCHSTORE_LOG_INFO("version restored", {observability::StringField("project_id", project_id),
                                          observability::IntField("version", static_cast<std::int64_t>(record.version_number)),
                                          observability::IntField("records", static_cast<std::int64_t>(records.size())),
                                          observability::IntField("safety_version", static_cast<std::int64_t>(safety.version_number()))});
  Publish(events::VersionEvent::Action::kRestored, record);
  return safety;
}

void VersionManager::DeleteVersion(const VersionInfo& snapshot) {
  const auto record = LoadRecord(snapshot.id());
  if (record.type == archstore::v1::VERSION_TYPE_MANUAL) {
    throw util::OperationForbidden("manual version " + std::to_string(record.version_number) + " of project " + record.project_id +
                                   " cannot be deleted");
  }

  engine_->RunSerialized(
      [&](db::Repository& repo, db::Transaction& tx) { db::ThrowIfError(repo.DeleteVersion(tx, record.id), "delete version " + record.id); });

  ARCHSTORE_LOG_INFO("version deleted", {observability::StringField("project_id", record.project_id),
                                         observability::IntField("version", static_cast<std::int64_t>(record.version_number)),
                                         observability::StringField("type", VersionTypeName(record.type))});
  Publish(events::VersionEvent::Action::kDeleted, record);
}

std::vector<VersionInfo> VersionManager::ListVersions(const std::string& project_id) const {
  std::vector<VersionInfo> out;
  engine_->RunRead([&](db::Repository& repo, db::Transaction& tx) {
    for (const auto& version : repo.ListVersions(tx, project_id)) out.push_back(ToVersionInfo(version));
  });
  return out;
}

std::optional<VersionInfo> VersionManager::GetVersion(const std::string& id) const {
  std::optional<VersionInfo> out;
  engine_->RunRead([&](db::Repository& repo, db::Transaction& tx) {
    if (auto version = repo.GetVersion(tx, id)) out = ToVersionInfo(*version);
  });
  return out;
}

std::optional<VersionInfo> VersionManager::GetVersionByNumber(const std::string& project_id, uint64_t number) const {
  std::optional<VersionInfo> out;
  engine_->RunRead([&](db::Repository& repo, db::Transaction& tx) {
    if (auto version = repo.GetVersionByNumber(tx, project_id, number)) out = ToVersionInfo(*version);
  });
  return out;
}

bool VersionManager::VerifyVersion(const VersionInfo& snapshot) const {
  const auto record = LoadRecord(snapshot.id());
  return util::VerifyChecksum(record.payload, record.checksum);
}

VersionStatistics VersionManager::Statistics(const std::string& project_id) const {
  VersionStatistics stats;
  engine_->RunRead([&](db::Repository& repo, db::Transaction& tx) {
    for (const auto& version : repo.ListVersions(tx, project_id)) {
      ++stats.total;
      if (version.type == archstore::v1::VERSION_TYPE_AUTOMATIC) ++stats.automatic;
      if (version.type == archstore::v1::VERSION_TYPE_MANUAL) ++stats.manual;
      stats.total_bytes += version.data_size;

      const auto created = util::FromUnixMillis(version.created_at_ms);
      if (!stats.oldest || created < *stats.oldest) stats.oldest = created;
      if (!stats.newest || created > *stats.newest) stats.newest = created;
    }
  });
  return stats;
}

VersionRecord VersionManager::LoadRecord(const std::string& id) const {
  std::optional<VersionRecord> record;
  engine_->RunRead([&](db::Repository& repo, db::Transaction& tx) { record = repo.GetVersion(tx, id); });
  if (!record) throw util::NotFound("version " + id + " does not exist");
  return std::move(*record);
}

void VersionManager::Publish(events::VersionEvent::Action action, const VersionRecord& record) const {
  const auto& bus = engine_->Bus();
  if (!bus) return;

  events::VersionEvent event;
  event.action         = action;
  event.project_id     = record.project_id;
  event.version_number = record.version_number;
  event.type           = record.type;
  bus->versions.Publish(event);
}

} // namespace archstore::history
