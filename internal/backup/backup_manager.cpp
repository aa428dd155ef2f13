#include "backup_manager.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace archstore::backup {

namespace fs = std::filesystem;

using archstore::v1::BackupIndex;
using archstore::v1::BackupRecord;

namespace {

constexpr const char* kIndexFile = "backup_metadata.json";

fs::path WithSuffix(const fs::path& path, const std::string& suffix) {
  return fs::path(path.string() + suffix);
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

BackupManager::BackupManager(BackupOptions options) : options_(std::move(options)) {
  if (!options_.clock) options_.clock = util::Now;
  if (options_.max_copy_attempts == 0) options_.max_copy_attempts = 1;

  std::error_code ec;
  fs::create_directories(options_.directory, ec);
  if (ec) throw util::StorageIOError("cannot create backup directory " + options_.directory.string() + ": " + ec.message());
}

fs::path BackupManager::IndexPath() const {
  return options_.directory / kIndexFile;
}

void BackupManager::CopyWithRetry(const fs::path& from, const fs::path& to) const {
  std::string last_error;
  for (uint32_t attempt = 1; attempt <= options_.max_copy_attempts; ++attempt) {
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (!ec) return;

    last_error = ec.message();
    ARCHSTORE_LOG_WARN("backup copy failed", {observability::StringField("from", from.string()), observability::StringField("to", to.string()),
                                              observability::IntField("attempt", attempt), observability::StringField("error", last_error)});
    if (attempt < options_.max_copy_attempts) std::this_thread::sleep_for(options_.retry_backoff);
  }
  throw util::StorageIOError("copy " + from.string() + " -> " + to.string() + " failed after " + std::to_string(options_.max_copy_attempts) +
                             " attempts: " + last_error);
}

void BackupManager::RemoveTriplet(const fs::path& main) {
  std::error_code ec;
  fs::remove(main, ec);
  if (ec) throw util::StorageIOError("cannot remove " + main.string() + ": " + ec.message());
  for (const auto* suffix : kJournalSuffixes) {
    fs::remove(WithSuffix(main, suffix), ec);
    if (ec) throw util::StorageIOError("cannot remove " + WithSuffix(main, suffix).string() + ": " + ec.message());
  }
}

BackupIndex BackupManager::LoadIndexLocked() const {
  BackupIndex index;
  if (!fs::exists(IndexPath())) return index;

  std::ifstream in(IndexPath(), std::ios::binary);
  if (!in) throw util::StorageIOError("cannot read " + IndexPath().string());
  std::stringstream buffer;
  buffer << in.rdbuf();

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(buffer.str(), &index, options);
  if (!status.ok()) throw util::CorruptionError("backup index " + IndexPath().string() + " is malformed: " + status.ToString());
  return index;
}

void BackupManager::SaveIndexLocked(const BackupIndex& index) const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(index, &json, options);
  if (!status.ok()) throw util::InvalidState("cannot encode backup index: " + status.ToString());

  // write-then-rename keeps the previous index intact on failure
  const auto tmp = WithSuffix(IndexPath(), ".tmp");
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out << json;
    if (!out) throw util::StorageIOError("cannot write " + tmp.string());
  }
  std::error_code ec;
  fs::rename(tmp, IndexPath(), ec);
  if (ec) throw util::StorageIOError("cannot replace " + IndexPath().string() + ": " + ec.message());
}

BackupRecord BackupManager::CreateBackup(const fs::path& store_path, archstore::v1::BackupType type, const std::string& schema_version) {
  observability::SpanScope span("archstore.backup.create");
  const auto               started = std::chrono::steady_clock::now();

  if (!fs::exists(store_path)) throw util::NotFound("store " + store_path.string() + " does not exist");

  const auto now = options_.clock();
  const auto id  = util::NewId();

  BackupRecord record;
  record.set_id(id);
  record.set_source_path(store_path.string());
  record.set_backup_path((options_.directory / ("backup_" + util::FormatFileTimestamp(now) + "_" + id + ".sqlite")).string());
  *record.mutable_created_at() = util::ToProto(now);
  *record.mutable_expires_at() = util::ToProto(now + options_.retention);
  record.set_type(type);
  record.set_schema_version(schema_version);

  std::lock_guard lock(mutex_);
  try {
    CopyWithRetry(store_path, record.backup_path());
    for (const auto* suffix : kJournalSuffixes) {
      const auto journal = WithSuffix(store_path, suffix);
      if (!fs::exists(journal)) continue;
      const auto target = WithSuffix(record.backup_path(), suffix);
      CopyWithRetry(journal, target);
      record.add_journal_files(target.string());
    }
  } catch (const util::StorageIOError&) {
    std::error_code ec;
    fs::remove(record.backup_path(), ec);
    for (const auto& journal : record.journal_files()) fs::remove(journal, ec);
    throw;
  }

  std::error_code ec;
  record.set_size_bytes(fs::file_size(record.backup_path(), ec));
  record.set_sha256(util::Sha256HexOfFile(record.backup_path()));

  auto index = LoadIndexLocked();
  *index.add_backups() = record;
  SaveIndexLocked(index);

  const double elapsed = ElapsedMs(started);
  observability::Metrics::Instance().ObserveBackupDurationMs("create", elapsed);
  ARCHSTORE_LOG_INFO("backup created", {observability::StringField("backup_id", id), observability::StringField("path", record.backup_path()),
                                        observability::IntField("size_bytes", static_cast<std::int64_t>(record.size_bytes())),
                                        observability::StringField("type", archstore::v1::BackupType_Name(type)),
                                        observability::DoubleField("duration_ms", elapsed)});
  return record;
}

void BackupManager::RestoreBackup(const BackupRecord& record, const fs::path& store_path) {
  const auto started = std::chrono::steady_clock::now();
  if (!fs::exists(record.backup_path())) throw util::NotFound("backup file " + record.backup_path() + " is missing");
  if (!record.sha256().empty() && util::Sha256HexOfFile(record.backup_path()) != record.sha256()) {
    throw util::CorruptionError("backup " + record.id() + " does not match its recorded digest");
  }

  std::lock_guard lock(mutex_);
  RemoveTriplet(store_path);
  CopyWithRetry(record.backup_path(), store_path);
  for (const auto* suffix : kJournalSuffixes) {
    const auto journal = WithSuffix(record.backup_path(), suffix);
    if (fs::exists(journal)) CopyWithRetry(journal, WithSuffix(store_path, suffix));
  }

  const double elapsed = ElapsedMs(started);
  observability::Metrics::Instance().ObserveBackupDurationMs("restore", elapsed);
  ARCHSTORE_LOG_INFO("backup restored", {observability::StringField("backup_id", record.id()), observability::StringField("target", store_path.string()),
                                         observability::DoubleField("duration_ms", elapsed)});
}

std::vector<BackupRecord> BackupManager::ListBackups() const {
  std::lock_guard lock(mutex_);
  auto            index = LoadIndexLocked();

  std::vector<BackupRecord> out(index.backups().begin(), index.backups().end());
  std::sort(out.begin(), out.end(), [](const BackupRecord& a, const BackupRecord& b) {
    if (a.created_at().seconds() != b.created_at().seconds()) return a.created_at().seconds() > b.created_at().seconds();
    if (a.created_at().nanos() != b.created_at().nanos()) return a.created_at().nanos() > b.created_at().nanos();
    return a.id() < b.id();
  });
  return out;
}

std::optional<BackupRecord> BackupManager::FindBackup(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            index = LoadIndexLocked();
  for (const auto& record : index.backups()) {
    if (record.id() == id) return record;
  }
  return std::nullopt;
}

void BackupManager::DeleteBackup(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            index = LoadIndexLocked();

  BackupIndex kept;
  bool        found = false;
  for (const auto& record : index.backups()) {
    if (record.id() != id) {
      *kept.add_backups() = record;
      continue;
    }
    found = true;
    RemoveTriplet(record.backup_path());
  }
  if (!found) throw util::NotFound("backup " + id + " not found");
  SaveIndexLocked(kept);

  ARCHSTORE_LOG_INFO("backup deleted", {observability::StringField("backup_id", id)});
}

uint32_t BackupManager::CleanupExpired() {
  const auto now = util::ToProto(options_.clock());

  std::lock_guard lock(mutex_);
  auto            index = LoadIndexLocked();

  BackupIndex kept;
  uint32_t    removed = 0;
  for (const auto& record : index.backups()) {
    const auto& expires = record.expires_at();
    const bool  expired = expires.seconds() < now.seconds() || (expires.seconds() == now.seconds() && expires.nanos() < now.nanos());
    if (!expired) {
      *kept.add_backups() = record;
      continue;
    }
    RemoveTriplet(record.backup_path());
    ++removed;
  }
  if (removed > 0) SaveIndexLocked(kept);

  ARCHSTORE_LOG_INFO("expired backups removed", {observability::IntField("removed", removed),
                                                 observability::IntField("remaining", kept.backups_size())});
  return removed;
}

uint32_t BackupManager::CleanupTemporaryFiles(const fs::path& store_path) {
  const auto directory = store_path.has_parent_path() ? store_path.parent_path() : fs::path(".");
  const auto stem      = store_path.filename().string();
  if (!fs::exists(directory)) return 0;

  std::vector<fs::path> leftovers;
  for (const auto& entry : fs::directory_iterator(directory)) {
    const auto name = entry.path().filename().string();
    if (name.rfind(stem + ".migrated_", 0) == 0 || name.rfind(stem + ".migration_temp", 0) == 0) leftovers.push_back(entry.path());
  }

  uint32_t removed = 0;
  for (const auto& path : leftovers) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) throw util::StorageIOError("cannot remove " + path.string() + ": " + ec.message());
    ++removed;
  }
  if (removed > 0) {
    ARCHSTORE_LOG_INFO("temporary migration files removed", {observability::StringField("store", store_path.string()),
                                                             observability::IntField("removed", removed)});
  }
  return removed;
}

} // namespace archstore::backup
