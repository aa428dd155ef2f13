#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "archstore/v1/integrity.pb.h"
#include "internal/backup/backup_manager.hpp"
#include "internal/storage/storage_engine.hpp"
#include "internal/sync/remote_sync.hpp"
#include "internal/util/time.hpp"

namespace archstore::integrity {

struct IntegrityOptions {
  double                    valid_threshold    = 0.8;
  bool                      auto_repair        = true;
  uint32_t                  quick_check_sample = 100;
  std::chrono::milliseconds quick_check_budget{std::chrono::seconds(2)};
  std::chrono::milliseconds full_check_timeout{std::chrono::minutes(5)};
  uint64_t                  max_entity_count     = 10000;
  uint64_t                  max_payload_bytes    = 10ull * 1024 * 1024;
  uint64_t                  min_free_bytes       = 100ull * 1024 * 1024;
  uint32_t                  max_issues_per_check = 100;
  util::SteadyFn            ticker               = util::SteadyNow;
};

using Issues = std::vector<archstore::v1::IntegrityIssue>;

struct CheckResult {
  Issues issues;
  double score = 1.0;
  bool   valid = true;
  bool   quick = false;

  // false when a quick check ran out of its time budget
  bool complete = true;

  std::optional<archstore::v1::RepairRecord> auto_repair;
  std::set<std::string>                      auto_repaired;  // issue ids
};

// max(0, 1 - (critical*0.5 + warning*0.3 + info*0.1) / 10)
double ComputeScore(const Issues& issues);

// Repairable issues of `result` that its automatic pass did not fix.
Issues OutstandingRepairs(const CheckResult& result);

const char* IssueTypeName(archstore::v1::IssueType type);
const char* IssueSeverityName(archstore::v1::IssueSeverity severity);

/*
  Scans the durable store for defects and repairs the ones with a safe
  remedy.

  Categories: consistency, relationships, corruption, performance, health.
  Issue ids are <type>:<subject>:<field>; each category keeps at most
  max_issues_per_check issues and results are sorted by id, so two checks
  of an unchanged store report the same issues in the same order.

  Each repair is its own atomic commit. Cancel() stops a check or repair
  before the next issue; a fix already committed stays.
*/
class IntegrityChecker {
 public:
  IntegrityChecker(std::shared_ptr<storage::StorageEngine> engine, std::shared_ptr<backup::BackupManager> backups, IntegrityOptions options = {});

  void AttachRemoteSync(std::shared_ptr<sync::RemoteSyncStatus> remote);

  // Every record, relationship and version. Auto-repairs repairable
  // non-critical issues when enabled.
  CheckResult RunFullCheck();

  // Sampled and bounded by quick_check_budget. Never repairs.
  CheckResult RunQuickCheck();

  archstore::v1::RepairRecord Repair(const Issues& issues, archstore::v1::RepairType type);

  archstore::v1::IntegrityReport GetReport() const;

  void   Cancel();
  double Progress() const {
    return progress_.load();
  }

  const IntegrityOptions& Options() const {
    return options_;
  }

 private:
  struct Scan;

  CheckResult                 RunCheck(bool quick);
  archstore::v1::RepairRecord RepairLocked(const Issues& issues, archstore::v1::RepairType type,
                                           std::set<std::string>* repaired_ids = nullptr);
  void                        Load(Scan& scan) const;
  bool                        OutOfTime(Scan& scan) const;
  Issues                      CheckConsistency(Scan& scan) const;
  Issues                      CheckRelationships(Scan& scan) const;
  Issues                      CheckCorruption(Scan& scan) const;
  Issues                      CheckPerformance(Scan& scan) const;
  Issues                      CheckHealth(Scan& scan) const;
  void                        Finish(Issues& category, Issues& out) const;
  void                        RepairOne(const archstore::v1::IntegrityIssue& issue);
  // Resets every listed field of one record in a single atomic change.
  void                        RepairFields(const std::string& id, const std::vector<const archstore::v1::IntegrityIssue*>& fields);
  void                        DeleteRecord(const std::string& id);

  std::shared_ptr<storage::StorageEngine> engine_;
  std::shared_ptr<backup::BackupManager>  backups_;
  IntegrityOptions                        options_;

  mutable std::mutex                      state_mutex_;
  std::shared_ptr<sync::RemoteSyncStatus> remote_;
  std::optional<CheckResult>              last_;
  std::optional<util::TimePoint>          last_check_at_;

  std::mutex          run_mutex_;
  std::atomic<double> progress_{0.0};
  std::atomic<bool>   cancel_requested_{false};
};

} // namespace archstore::integrity
