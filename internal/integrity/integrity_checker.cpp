#include "integrity_checker.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iterator>
#include <map>
#include <set>

#include "internal/history/snapshot_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace archstore::integrity {

namespace fs = std::filesystem;

using archstore::v1::IntegrityIssue;
using archstore::v1::IssueSeverity;
using archstore::v1::IssueType;
using db::model::Record;
using db::model::VersionRecord;

namespace {

constexpr const char* kVersionSubject    = "version";
constexpr const char* kUntitledProject   = "Untitled Project";
constexpr std::size_t kCategoryCount     = 5;
constexpr uint32_t    kManyIssuesWarning = 20;

IntegrityIssue NewIssue(IssueType type, IssueSeverity severity, const std::string& entity, const std::string& subject, const std::string& field,
                        const std::string& title) {
  IntegrityIssue issue;
  issue.set_id(std::string(IssueTypeName(type)) + ":" + subject + ":" + field);
  issue.set_type(type);
  issue.set_severity(severity);
  issue.set_entity(entity);
  issue.set_record_id(subject);
  issue.set_field(field);
  issue.set_title(title);
  return issue;
}

bool IsJsonDocument(const std::string& text) {
  google::protobuf::Value value;
  return google::protobuf::util::JsonStringToMessage(text, &value).ok();
}

bool HasDefault(const model::FieldSpec& spec) {
  return !std::holds_alternative<std::monostate>(spec.default_value);
}

bool IsProjectName(const Record& record, const std::string& field) {
  return record.entity == model::kProjectEntity && field == "name";
}

const char* RepairTypeName(archstore::v1::RepairType type) {
  return type == archstore::v1::REPAIR_TYPE_MANUAL ? "manual" : "automatic";
}

archstore::v1::RepairRecord ToProto(const db::model::RepairRecord& record) {
  archstore::v1::RepairRecord out;
  out.set_id(record.id);
  *out.mutable_performed_at() = util::ToProto(util::FromUnixMillis(record.performed_at_ms));
  out.set_attempted(record.attempted);
  out.set_repaired(record.repaired);
  out.set_failed(record.failed);
  out.set_duration_ms(record.duration_ms);
  out.set_type(record.type);
  return out;
}

} // namespace

struct IntegrityChecker::Scan {
  bool                                  quick            = false;
  bool                                  budget_exhausted = false;
  std::chrono::steady_clock::time_point deadline;

  db::Repository*  repo = nullptr;
  db::Transaction* tx   = nullptr;

  std::vector<Record>             records;
  std::set<std::string>           ids;
  std::vector<VersionRecord>      versions;
  std::map<std::string, uint64_t> entity_counts;

  // Sampled scans fall back to the store for ids outside the sample.
  bool Exists(const std::string& id) const {
    if (ids.contains(id)) return true;
    return quick && repo->GetRecord(*tx, id).has_value();
  }
};

double ComputeScore(const Issues& issues) {
  double weighted = 0.0;
  for (const auto& issue : issues) {
    switch (issue.severity()) {
      case archstore::v1::ISSUE_SEVERITY_CRITICAL:
        weighted += 0.5;
        break;
      case archstore::v1::ISSUE_SEVERITY_WARNING:
        weighted += 0.3;
        break;
      case archstore::v1::ISSUE_SEVERITY_INFO:
        weighted += 0.1;
        break;
      default:
        break;
    }
  }
  return std::clamp(1.0 - weighted / 10.0, 0.0, 1.0);
}

Issues OutstandingRepairs(const CheckResult& result) {
  Issues pending;
  for (const auto& issue : result.issues) {
    if (issue.repairable() && !result.auto_repaired.contains(issue.id())) pending.push_back(issue);
  }
  return pending;
}

const char* IssueTypeName(IssueType type) {
  switch (type) {
    case archstore::v1::ISSUE_TYPE_ORPHANED_RECORD:
      return "orphaned_record";
    case archstore::v1::ISSUE_TYPE_MISSING_RELATIONSHIP:
      return "missing_relationship";
    case archstore::v1::ISSUE_TYPE_INVALID_FIELD:
      return "invalid_field";
    case archstore::v1::ISSUE_TYPE_CORRUPTED_CHECKSUM:
      return "corrupted_checksum";
    case archstore::v1::ISSUE_TYPE_DUPLICATE_ENTITY:
      return "duplicate_entity";
    case archstore::v1::ISSUE_TYPE_INCONSISTENT_STATE:
      return "inconsistent_state";
    case archstore::v1::ISSUE_TYPE_PERFORMANCE:
      return "performance";
    case archstore::v1::ISSUE_TYPE_STORAGE:
      return "storage";
    case archstore::v1::ISSUE_TYPE_SYNC:
      return "sync";
    case archstore::v1::ISSUE_TYPE_BACKUP:
      return "backup";
    default:
      return "unspecified";
  }
}

const char* IssueSeverityName(IssueSeverity severity) {
  switch (severity) {
    case archstore::v1::ISSUE_SEVERITY_CRITICAL:
      return "critical";
    case archstore::v1::ISSUE_SEVERITY_WARNING:
      return "warning";
    case archstore::v1::ISSUE_SEVERITY_INFO:
      return "info";
    default:
      return "unspecified";
  }
}

IntegrityChecker::IntegrityChecker(std::shared_ptr<storage::StorageEngine> engine, std::shared_ptr<backup::BackupManager> backups,
                                   IntegrityOptions options)
    : engine_(std::move(engine)), backups_(std::move(backups)), options_(options) {
}

void IntegrityChecker::AttachRemoteSync(std::shared_ptr<sync::RemoteSyncStatus> remote) {
  std::lock_guard lock(state_mutex_);
  remote_ = std::move(remote);
}

void IntegrityChecker::Cancel() {
  cancel_requested_ = true;
}

CheckResult IntegrityChecker::RunFullCheck() {
  std::lock_guard lock(run_mutex_);
  auto            result = RunCheck(false);

  if (options_.auto_repair) {
    Issues safe;
    for (const auto& issue : result.issues) {
      if (issue.repairable() && issue.severity() != archstore::v1::ISSUE_SEVERITY_CRITICAL) safe.push_back(issue);
    }
    if (!safe.empty()) result.auto_repair = RepairLocked(safe, archstore::v1::REPAIR_TYPE_AUTOMATIC, &result.auto_repaired);
  }
  return result;
}

CheckResult IntegrityChecker::RunQuickCheck() {
  std::lock_guard lock(run_mutex_);
  return RunCheck(true);
}

archstore::v1::RepairRecord IntegrityChecker::Repair(const Issues& issues, archstore::v1::RepairType type) {
  std::lock_guard lock(run_mutex_);
  return RepairLocked(issues, type);
}

bool IntegrityChecker::OutOfTime(Scan& scan) const {
  if (cancel_requested_) throw util::OperationCancelled("integrity check cancelled");
  if (scan.budget_exhausted) return true;
  if (options_.ticker() <= scan.deadline) return false;
  if (!scan.quick) throw util::OperationTimedOut("full integrity check exceeded " + std::to_string(options_.full_check_timeout.count()) + "ms");
  scan.budget_exhausted = true;
  return true;
}

CheckResult IntegrityChecker::RunCheck(bool quick) {
  observability::SpanScope span("archstore.integrity.check");
  span.SetAttribute("quick", quick ? "true" : "false");

  cancel_requested_ = false;
  progress_         = 0.0;

  const auto checked_at = engine_->Clock()();

  Scan scan;
  scan.quick    = quick;
  scan.deadline = options_.ticker() + (quick ? options_.quick_check_budget : options_.full_check_timeout);

  using Category = Issues (IntegrityChecker::*)(Scan&) const;
  const Category categories[kCategoryCount] = {&IntegrityChecker::CheckConsistency, &IntegrityChecker::CheckRelationships,
                                               &IntegrityChecker::CheckCorruption, &IntegrityChecker::CheckPerformance,
                                               &IntegrityChecker::CheckHealth};

  CheckResult result;
  result.quick = quick;
  try {
    engine_->RunRead([&](db::Repository& repo, db::Transaction& tx) {
      scan.repo = &repo;
      scan.tx   = &tx;
      Load(scan);
      for (std::size_t i = 0; i < kCategoryCount; ++i) {
        if (OutOfTime(scan)) break;
        auto found = (this->*categories[i])(scan);
        Finish(found, result.issues);
        progress_ = static_cast<double>(i + 1) / static_cast<double>(kCategoryCount);
      }
    });
  } catch (const util::StoreError& e) {
    span.RecordException(e.what());
    ARCHSTORE_LOG_WARN("integrity check aborted", {observability::BoolField("quick", quick), observability::StringField("error", e.what())});
    throw;
  }

  std::sort(result.issues.begin(), result.issues.end(), [](const auto& a, const auto& b) { return a.id() < b.id(); });
  for (auto& issue : result.issues) *issue.mutable_discovered_at() = util::ToProto(checked_at);

  uint32_t critical = 0;
  for (const auto& issue : result.issues) {
    if (issue.severity() == archstore::v1::ISSUE_SEVERITY_CRITICAL) ++critical;
  }
  result.score    = ComputeScore(result.issues);
  result.valid    = result.score >= options_.valid_threshold;
  result.complete = !scan.budget_exhausted;

  {
    std::lock_guard lock(state_mutex_);
    last_          = result;
    last_check_at_ = checked_at;
  }

  span.SetAttribute("score", result.score);
  observability::Metrics::Instance().SetIntegrityScore(result.score);
  ARCHSTORE_LOG_INFO("integrity check completed", {observability::BoolField("quick", quick), observability::DoubleField("score", result.score),
                                                   observability::IntField("issues", static_cast<std::int64_t>(result.issues.size())),
                                                   observability::IntField("critical", critical), observability::BoolField("valid", result.valid),
                                                   observability::BoolField("complete", result.complete)});

  if (const auto& bus = engine_->Bus()) {
    events::IntegrityEvent event;
    event.score        = result.score;
    event.total_issues = static_cast<uint32_t>(result.issues.size());
    event.critical     = critical;
    event.quick        = quick;
    bus->integrity.Publish(event);
  }
  return result;
}

void IntegrityChecker::Load(Scan& scan) const {
  auto& repo = *scan.repo;
  auto& tx   = *scan.tx;

  const auto entities = repo.ListEntities(tx);
  if (scan.quick) {
    for (const auto& entity : entities) {
      auto query  = db::RecordQuery::ForEntity(entity);
      query.limit = options_.quick_check_sample;
      auto sample = repo.ListRecords(tx, query);
      std::move(sample.begin(), sample.end(), std::back_inserter(scan.records));
    }
  } else {
    scan.records = repo.ListRecords(tx, db::RecordQuery{});
  }
  for (const auto& record : scan.records) scan.ids.insert(record.id);

  scan.versions = repo.ListAllVersions(tx);
  if (scan.quick && scan.versions.size() > options_.quick_check_sample) {
    scan.versions.erase(scan.versions.begin() + options_.quick_check_sample, scan.versions.end());
  }

  for (const auto& entity : entities) scan.entity_counts[entity] = repo.CountRecords(tx, db::RecordQuery::ForEntity(entity));
}

void IntegrityChecker::Finish(Issues& category, Issues& out) const {
  std::sort(category.begin(), category.end(), [](const auto& a, const auto& b) { return a.id() < b.id(); });
  if (options_.max_issues_per_check > 0 && category.size() > options_.max_issues_per_check) category.resize(options_.max_issues_per_check);
  std::move(category.begin(), category.end(), std::back_inserter(out));
}

Issues IntegrityChecker::CheckConsistency(Scan& scan) const {
  Issues      issues;
  const auto& schema = engine_->Schema();

  for (const auto& record : scan.records) {
    if (OutOfTime(scan)) break;

    const auto* entity = schema.FindEntity(record.entity);
    if (!entity) {
      auto issue = NewIssue(archstore::v1::ISSUE_TYPE_INCONSISTENT_STATE, archstore::v1::ISSUE_SEVERITY_CRITICAL, record.entity, record.id, "entity",
                            "Unknown entity");
      issue.set_description("entity " + record.entity + " is not part of schema " + schema.version);
      issues.push_back(std::move(issue));
      continue;
    }

    if (record.entity == model::kProjectEntity && record.project_id != record.id) {
      auto issue = NewIssue(archstore::v1::ISSUE_TYPE_INCONSISTENT_STATE, archstore::v1::ISSUE_SEVERITY_WARNING, record.entity, record.id,
                            "project_id", "Project does not own itself");
      issue.set_description("project_id is '" + record.project_id + "'");
      issue.set_repairable(true);
      issue.set_remedy("Set project_id to the project id");
      issues.push_back(std::move(issue));
    }

    for (const auto& spec : entity->fields) {
      const auto* value   = record.Find(spec.name);
      const bool  fixable = HasDefault(spec) || IsProjectName(record, spec.name);

      if (!value || std::holds_alternative<std::monostate>(*value)) {
        if (!spec.required) continue;
        auto issue = NewIssue(archstore::v1::ISSUE_TYPE_INVALID_FIELD, archstore::v1::ISSUE_SEVERITY_CRITICAL, record.entity, record.id, spec.name,
                              "Missing required field");
        issue.set_description("required field " + spec.name + " is absent");
        issue.set_repairable(fixable);
        issue.set_remedy("Reset the field to its default");
        issues.push_back(std::move(issue));
        continue;
      }

      if (!model::MatchesKind(*value, spec.kind)) {
        auto issue = NewIssue(archstore::v1::ISSUE_TYPE_INVALID_FIELD, archstore::v1::ISSUE_SEVERITY_CRITICAL, record.entity, record.id, spec.name,
                              "Wrong field kind");
        issue.set_description("expected " + std::string(model::FieldKindName(spec.kind)) + ", found " + db::model::DescribeValue(*value));
        issue.set_repairable(fixable);
        issue.set_remedy("Reset the field to its default");
        issues.push_back(std::move(issue));
        continue;
      }

      if (const auto* number = std::get_if<double>(value); number && !std::isfinite(*number)) {
        auto issue = NewIssue(archstore::v1::ISSUE_TYPE_INVALID_FIELD, archstore::v1::ISSUE_SEVERITY_CRITICAL, record.entity, record.id, spec.name,
                              "Non-finite number");
        issue.set_description(spec.name + " is " + db::model::DescribeValue(*value));
        issue.set_repairable(fixable);
        issue.set_remedy("Reset the field to its default");
        issues.push_back(std::move(issue));
        continue;
      }

      if (spec.kind == model::FieldKind::kJson && !IsJsonDocument(std::get<std::string>(*value))) {
        auto issue = NewIssue(archstore::v1::ISSUE_TYPE_INVALID_FIELD, archstore::v1::ISSUE_SEVERITY_WARNING, record.entity, record.id, spec.name,
                              "Malformed JSON field");
        issue.set_description(spec.name + " does not hold a JSON document");
        issue.set_repairable(fixable);
        issue.set_remedy("Reset the field to its default");
        issues.push_back(std::move(issue));
        continue;
      }

      if (IsProjectName(record, spec.name) && std::get<std::string>(*value).empty()) {
        auto issue = NewIssue(archstore::v1::ISSUE_TYPE_INVALID_FIELD, archstore::v1::ISSUE_SEVERITY_WARNING, record.entity, record.id, spec.name,
                              "Empty project name");
        issue.set_description("project has an empty name");
        issue.set_repairable(true);
        issue.set_remedy(std::string("Rename to '") + kUntitledProject + "'");
        issues.push_back(std::move(issue));
      }
    }
  }
  return issues;
}

Issues IntegrityChecker::CheckRelationships(Scan& scan) const {
  Issues      issues;
  const auto& schema = engine_->Schema();

  std::map<std::string, std::vector<const Record*>> catalog_by_name;

  for (const auto& record : scan.records) {
    if (OutOfTime(scan)) return issues;

    const auto* entity = schema.FindEntity(record.entity);
    if (entity && entity->catalog) {
      if (auto name = record.GetString("name")) catalog_by_name[*name].push_back(&record);
    } else if (record.entity != model::kProjectEntity && (record.project_id.empty() || !scan.Exists(record.project_id))) {
      auto issue = NewIssue(archstore::v1::ISSUE_TYPE_ORPHANED_RECORD, archstore::v1::ISSUE_SEVERITY_CRITICAL, record.entity, record.id, "project_id",
                            "Orphaned record");
      issue.set_description("project '" + record.project_id + "' does not exist");
      issue.set_repairable(true);
      issue.set_remedy("Delete the orphaned record");
      issues.push_back(std::move(issue));
    }

    for (const auto& relationship : record.relationships) {
      if (scan.Exists(relationship.target_id)) continue;
      auto issue = NewIssue(archstore::v1::ISSUE_TYPE_MISSING_RELATIONSHIP, archstore::v1::ISSUE_SEVERITY_WARNING, record.entity, record.id,
                            relationship.name + "->" + relationship.target_id, "Dangling relationship");
      issue.set_description(relationship.name + " points to missing record " + relationship.target_id);
      issue.set_repairable(true);
      issue.set_remedy("Remove the dangling reference");
      issues.push_back(std::move(issue));
    }
  }

  for (const auto& version : scan.versions) {
    if (scan.Exists(version.project_id)) continue;
    auto issue = NewIssue(archstore::v1::ISSUE_TYPE_ORPHANED_RECORD, archstore::v1::ISSUE_SEVERITY_CRITICAL, kVersionSubject, version.id, "project_id",
                          "Orphaned version");
    issue.set_description("version " + std::to_string(version.version_number) + " belongs to missing project " + version.project_id);
    issue.set_repairable(true);
    issue.set_remedy("Delete the orphaned version");
    issues.push_back(std::move(issue));
  }

  for (auto& [name, entries] : catalog_by_name) {
    if (entries.size() < 2) continue;
    std::sort(entries.begin(), entries.end(), [](const Record* a, const Record* b) {
      return a->created_at_ms != b->created_at_ms ? a->created_at_ms < b->created_at_ms : a->id < b->id;
    });
    for (std::size_t i = 1; i < entries.size(); ++i) {
      auto issue = NewIssue(archstore::v1::ISSUE_TYPE_DUPLICATE_ENTITY, archstore::v1::ISSUE_SEVERITY_WARNING, entries[i]->entity, entries[i]->id,
                            "name", "Duplicate catalog entry");
      issue.set_description("'" + name + "' duplicates catalog record " + entries.front()->id);
      issue.set_repairable(true);
      issue.set_remedy("Delete the newer duplicate");
      issues.push_back(std::move(issue));
    }
  }
  return issues;
}

Issues IntegrityChecker::CheckCorruption(Scan& scan) const {
  Issues issues;
  for (const auto& version : scan.versions) {
    if (OutOfTime(scan)) break;

    bool parses = true;
    try {
      history::ParseProjectSnapshot(version.payload);
    } catch (const util::CorruptionError& e) {
      parses     = false;
      auto issue = NewIssue(archstore::v1::ISSUE_TYPE_CORRUPTED_CHECKSUM, archstore::v1::ISSUE_SEVERITY_CRITICAL, kVersionSubject, version.id,
                            "payload", "Malformed snapshot payload");
      issue.set_description(e.what());
      issues.push_back(std::move(issue));
    }

    if (!util::VerifyChecksum(version.payload, version.checksum)) {
      auto issue = NewIssue(archstore::v1::ISSUE_TYPE_CORRUPTED_CHECKSUM, archstore::v1::ISSUE_SEVERITY_CRITICAL, kVersionSubject, version.id,
                            "checksum", "Checksum mismatch");
      issue.set_description("version " + std::to_string(version.version_number) + " of project " + version.project_id +
                            " does not match its checksum");
      issue.set_repairable(parses);
      if (parses) issue.set_remedy("Recompute the checksum from the stored payload");
      issues.push_back(std::move(issue));
    }
  }
  return issues;
}

Issues IntegrityChecker::CheckPerformance(Scan& scan) const {
  Issues issues;
  for (const auto& [entity, count] : scan.entity_counts) {
    if (count <= options_.max_entity_count) continue;
    auto issue =
        NewIssue(archstore::v1::ISSUE_TYPE_PERFORMANCE, archstore::v1::ISSUE_SEVERITY_INFO, entity, entity, "count", "Large entity count");
    issue.set_description(std::to_string(count) + " " + entity + " records exceed " + std::to_string(options_.max_entity_count));
    issues.push_back(std::move(issue));
  }
  for (const auto& version : scan.versions) {
    if (version.payload.size() <= options_.max_payload_bytes) continue;
    auto issue = NewIssue(archstore::v1::ISSUE_TYPE_PERFORMANCE, archstore::v1::ISSUE_SEVERITY_INFO, kVersionSubject, version.id, "payload_size",
                          "Large snapshot payload");
    issue.set_description(std::to_string(version.payload.size()) + " bytes exceed " + std::to_string(options_.max_payload_bytes));
    issues.push_back(std::move(issue));
  }
  return issues;
}

Issues IntegrityChecker::CheckHealth(Scan&) const {
  Issues issues;

  if (options_.min_free_bytes > 0) {
    auto directory = fs::path(engine_->Path()).parent_path();
    if (directory.empty()) directory = ".";

    std::error_code ec;
    const auto      space = fs::space(directory, ec);
    if (ec) {
      auto issue = NewIssue(archstore::v1::ISSUE_TYPE_STORAGE, archstore::v1::ISSUE_SEVERITY_WARNING, "", directory.string(), "free_space",
                            "Free space unknown");
      issue.set_description(ec.message());
      issues.push_back(std::move(issue));
    } else if (space.available < options_.min_free_bytes) {
      auto issue = NewIssue(archstore::v1::ISSUE_TYPE_STORAGE, archstore::v1::ISSUE_SEVERITY_CRITICAL, "", directory.string(), "free_space",
                            "Low disk space");
      issue.set_description(std::to_string(space.available) + " bytes available, " + std::to_string(options_.min_free_bytes) + " required");
      issues.push_back(std::move(issue));
    }
  }

  std::shared_ptr<sync::RemoteSyncStatus> remote;
  {
    std::lock_guard lock(state_mutex_);
    remote = remote_;
  }
  if (remote && !remote->IsReachable()) {
    auto issue = NewIssue(archstore::v1::ISSUE_TYPE_SYNC, archstore::v1::ISSUE_SEVERITY_WARNING, "", remote->Describe(), "reachability",
                          "Remote sync unreachable");
    issue.set_description(remote->Describe() + " did not respond");
    issues.push_back(std::move(issue));
  }

  if (backups_) {
    for (const auto& backup : backups_->ListBackups()) {
      if (fs::exists(backup.backup_path())) continue;
      auto issue = NewIssue(archstore::v1::ISSUE_TYPE_BACKUP, archstore::v1::ISSUE_SEVERITY_WARNING, "", backup.id(), "backup_path", "Missing backup file");
      issue.set_description(backup.backup_path() + " is indexed but missing");
      issue.set_repairable(true);
      issue.set_remedy("Remove the stale index entry");
      issues.push_back(std::move(issue));
    }
  }
  return issues;
}

archstore::v1::RepairRecord IntegrityChecker::RepairLocked(const Issues& issues, archstore::v1::RepairType type,
                                                           std::set<std::string>* repaired_ids) {
  observability::SpanScope span("archstore.integrity.repair");
  span.SetAttribute("type", RepairTypeName(type));

  cancel_requested_  = false;
  const auto started = std::chrono::steady_clock::now();

  db::model::RepairRecord record;
  record.id   = util::NewId();
  record.type = type;

  // Field issues of one record are repaired together; the record only
  // validates once all of its bad fields hold defaults.
  std::vector<std::vector<const IntegrityIssue*>> units;
  std::map<std::string, size_t>                   field_units;
  for (const auto& issue : issues) {
    if (!issue.repairable()) continue;
    if (issue.type() != archstore::v1::ISSUE_TYPE_INVALID_FIELD) {
      units.push_back({&issue});
      continue;
    }
    auto [it, inserted] = field_units.emplace(issue.record_id(), units.size());
    if (inserted) units.emplace_back();
    units[it->second].push_back(&issue);
  }

  bool cancelled = false;
  for (const auto& unit : units) {
    if (cancel_requested_) {
      cancelled = true;
      break;
    }

    const auto& first = *unit.front();
    record.attempted += static_cast<uint32_t>(unit.size());
    try {
      if (first.type() == archstore::v1::ISSUE_TYPE_INVALID_FIELD) {
        RepairFields(first.record_id(), unit);
      } else {
        RepairOne(first);
      }
      record.repaired += static_cast<uint32_t>(unit.size());
      for (const auto* issue : unit) {
        if (repaired_ids) repaired_ids->insert(issue->id());
        ARCHSTORE_LOG_INFO("integrity issue repaired", {observability::StringField("issue", issue->id()),
                                                        observability::StringField("remedy", issue->remedy()),
                                                        observability::StringField("type", RepairTypeName(type))});
      }
    } catch (const util::StoreError& e) {
      record.failed += static_cast<uint32_t>(unit.size());
      ARCHSTORE_LOG_WARN("integrity repair failed", {observability::StringField("issue", first.id()),
                                                     observability::IntField("issues", static_cast<int64_t>(unit.size())),
                                                     observability::StringField("error", e.what())});
      if (util::IsFatal(e)) throw;
    }
  }

  record.performed_at_ms = util::ToUnixMillis(engine_->Clock()());
  record.duration_ms     = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());

  engine_->RunSerialized(
      [&](db::Repository& repo, db::Transaction& tx) { db::ThrowIfError(repo.InsertRepairRecord(tx, record), "record repair pass"); });

  observability::Metrics::Instance().RecordRepairs(RepairTypeName(type), record.repaired, record.failed);
  ARCHSTORE_LOG_INFO("integrity repair finished", {observability::StringField("type", RepairTypeName(type)),
                                                   observability::IntField("attempted", record.attempted),
                                                   observability::IntField("repaired", record.repaired),
                                                   observability::IntField("failed", record.failed),
                                                   observability::BoolField("cancelled", cancelled)});

  if (cancelled) throw util::OperationCancelled("integrity repair cancelled after " + std::to_string(record.attempted) + " issues");
  return ToProto(record);
}

void IntegrityChecker::DeleteRecord(const std::string& id) {
  auto context = engine_->OpenContext(storage::Isolation::kBackground);
  engine_->RunAtomic(context, [&](storage::WorkingContext& ctx) { ctx.Delete(id); });
}

void IntegrityChecker::RepairFields(const std::string& id, const std::vector<const IntegrityIssue*>& fields) {
  auto context = engine_->OpenContext(storage::Isolation::kBackground);
  engine_->RunAtomic(context, [&](storage::WorkingContext& ctx) {
    auto record = ctx.Get(id);
    if (!record) throw util::NotFound("record " + id + " no longer exists");

    const auto* entity = engine_->Schema().FindEntity(record->entity);
    for (const auto* issue : fields) {
      db::model::FieldValue value;
      if (IsProjectName(*record, issue->field())) {
        value = std::string(kUntitledProject);
      } else {
        const auto* spec = entity ? entity->FindField(issue->field()) : nullptr;
        if (!spec || !HasDefault(*spec)) throw util::InvalidState("no safe default for " + record->entity + "." + issue->field());
        value = spec->default_value;
      }
      ctx.SetField(id, issue->field(), std::move(value));
    }
  });
}

void IntegrityChecker::RepairOne(const IntegrityIssue& issue) {
  const auto& id = issue.record_id();

  switch (issue.type()) {
    case archstore::v1::ISSUE_TYPE_ORPHANED_RECORD:
      if (issue.entity() == kVersionSubject) {
        engine_->RunSerialized(
            [&](db::Repository& repo, db::Transaction& tx) { db::ThrowIfError(repo.DeleteVersion(tx, id), "delete orphaned version " + id); });
      } else {
        DeleteRecord(id);
      }
      return;

    case archstore::v1::ISSUE_TYPE_DUPLICATE_ENTITY:
      DeleteRecord(id);
      return;

    case archstore::v1::ISSUE_TYPE_MISSING_RELATIONSHIP: {
      auto context = engine_->OpenContext(storage::Isolation::kBackground);
      engine_->RunAtomic(context, [&](storage::WorkingContext& ctx) {
        auto record = ctx.Get(id);
        if (!record) throw util::NotFound("record " + id + " no longer exists");
        std::vector<db::model::Relationship> kept;
        for (const auto& relationship : record->relationships) {
          if (ctx.Get(relationship.target_id)) kept.push_back(relationship);
        }
        ctx.SetRelationships(id, std::move(kept));
      });
      return;
    }

    case archstore::v1::ISSUE_TYPE_INVALID_FIELD:
      RepairFields(id, {&issue});
      return;

    case archstore::v1::ISSUE_TYPE_INCONSISTENT_STATE: {
      if (issue.field() != "project_id") break;
      auto context = engine_->OpenContext(storage::Isolation::kBackground);
      engine_->RunAtomic(context, [&](storage::WorkingContext& ctx) {
        auto record = ctx.Get(id);
        if (!record) throw util::NotFound("record " + id + " no longer exists");
        record->project_id = record->id;
        ctx.Update(std::move(*record));
      });
      return;
    }

    case archstore::v1::ISSUE_TYPE_CORRUPTED_CHECKSUM:
      if (issue.field() != "checksum") break;
      engine_->RunSerialized([&](db::Repository& repo, db::Transaction& tx) {
        auto version = repo.GetVersion(tx, id);
        if (!version) throw util::NotFound("version " + id + " no longer exists");
        history::ParseProjectSnapshot(version->payload);
        db::ThrowIfError(repo.UpdateVersionChecksum(tx, id, util::Sha256Hex(version->payload)), "recompute checksum of version " + id);
      });
      return;

    case archstore::v1::ISSUE_TYPE_BACKUP:
      if (!backups_) break;
      backups_->DeleteBackup(id);
      return;

    default:
      break;
  }
  throw util::InvalidState("no repair routine for " + issue.id());
}

archstore::v1::IntegrityReport IntegrityChecker::GetReport() const {
  archstore::v1::IntegrityReport report;
  report.set_overall_score(1.0);
  report.set_valid(true);

  {
    std::lock_guard lock(state_mutex_);
    if (last_check_at_) *report.mutable_last_check_date() = util::ToProto(*last_check_at_);
    if (last_) {
      report.set_overall_score(last_->score);
      report.set_valid(last_->valid);
      report.set_total_issues(static_cast<uint32_t>(last_->issues.size()));
      for (const auto& issue : last_->issues) {
        ++(*report.mutable_issues_by_type())[IssueTypeName(issue.type())];
        ++(*report.mutable_issues_by_severity())[IssueSeverityName(issue.severity())];
        *report.add_issues() = issue;
      }
    }
  }

  engine_->RunRead([&](db::Repository& repo, db::Transaction& tx) {
    for (const auto& repair : repo.ListRepairRecords(tx)) *report.add_repair_history() = ToProto(repair);
  });

  if (report.overall_score() < options_.valid_threshold) report.add_recommendations("Consider running a full integrity repair");
  if (report.total_issues() > kManyIssuesWarning) report.add_recommendations("Large number of issues detected - investigate data sources");
  const auto& by_severity = report.issues_by_severity();
  if (auto it = by_severity.find("critical"); it != by_severity.end() && it->second > 0) {
    report.add_recommendations("Critical issues require immediate attention");
  }
  return report;
}

} // namespace archstore::integrity
