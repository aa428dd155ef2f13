#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "archstore/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using archstore::factory::StoreRuntime;
using archstore::runtime::config::RuntimeConfig;

static void Usage() {
  std::cout << "Usage:\n"
            << "  archstorectl <config.yaml> status\n"
            << "  archstorectl <config.yaml> migrate\n"
            << "  archstorectl <config.yaml> versions <project>\n"
            << "  archstorectl <config.yaml> snapshot <project> [comment]\n"
            << "  archstorectl <config.yaml> restore <project> <version>\n"
            << "  archstorectl <config.yaml> delete-version <project> <version>\n"
            << "  archstorectl <config.yaml> verify <project> <version>\n"
            << "  archstorectl <config.yaml> check [--quick] [--repair]\n"
            << "  archstorectl <config.yaml> report\n"
            << "  archstorectl <config.yaml> backup\n"
            << "  archstorectl <config.yaml> backups\n"
            << "  archstorectl <config.yaml> restore-backup <id>\n"
            << "  archstorectl <config.yaml> cleanup-backups\n";
}

static int ExitCode(archstore::util::ErrorClass error_class) {
  using archstore::util::ErrorClass;
  switch (error_class) {
    case ErrorClass::kValidation:
    case ErrorClass::kConflict:
      return 3;
    case ErrorClass::kNotFound:
    case ErrorClass::kAlreadyExists:
      return 4;
    case ErrorClass::kCorruption:
      return 5;
    case ErrorClass::kMigrationPathNotFound:
    case ErrorClass::kMigration:
      return 6;
    case ErrorClass::kIO:
    case ErrorClass::kRollbackFailure:
      return 7;
    default:
      return 2;
  }
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) throw archstore::util::InvalidState("cannot print " + message.GetTypeName() + ": " + status.ToString());
  std::cout << json;
}

static archstore::v1::VersionInfo RequireVersion(StoreRuntime& runtime, const std::string& project_id, const std::string& number) {
  auto version = runtime.versions->GetVersionByNumber(project_id, std::stoull(number));
  if (!version) throw archstore::util::NotFound("project " + project_id + " has no version " + number);
  return *version;
}

static int Run(const RuntimeConfig& config, const std::string& cmd, const std::vector<std::string>& args) {
  const auto& store_path = config.store().path();

  // ------------------------------------------------------------
  // Commands that work on the closed store file
  // ------------------------------------------------------------

  if (cmd == "status") {
    auto backups    = archstore::factory::BuildBackupManager(config);
    auto migrations = archstore::factory::BuildMigrationEngine(config, backups, nullptr);
    PrintJson(migrations->Diagnostics(store_path));
    return 0;
  }

  if (cmd == "backups") {
    archstore::v1::BackupIndex index;
    for (const auto& record : archstore::factory::BuildBackupManager(config)->ListBackups()) *index.add_backups() = record;
    PrintJson(index);
    return 0;
  }

  if (cmd == "backup") {
    auto backups    = archstore::factory::BuildBackupManager(config);
    auto migrations = archstore::factory::BuildMigrationEngine(config, backups, nullptr);
    auto version    = migrations->StoredVersion(store_path);
    if (!version) throw archstore::util::NotFound("store " + store_path + " does not exist");
    PrintJson(backups->CreateBackup(store_path, archstore::v1::BACKUP_TYPE_MANUAL, *version));
    return 0;
  }

  if (cmd == "restore-backup") {
    if (args.size() < 1) return 1;
    auto backups = archstore::factory::BuildBackupManager(config);
    auto record  = backups->FindBackup(args[0]);
    if (!record) throw archstore::util::NotFound("backup " + args[0] + " not found");
    backups->RestoreBackup(*record, store_path);
    std::cout << "restored " << record->backup_path() << " to " << store_path << "\n";
    return 0;
  }

  if (cmd == "cleanup-backups") {
    auto backups = archstore::factory::BuildBackupManager(config);
    auto removed   = backups->CleanupExpired();
    auto leftovers = backups->CleanupTemporaryFiles(store_path);
    std::cout << "removed " << removed << " expired backups, " << leftovers << " temporary files\n";
    return 0;
  }

  // ------------------------------------------------------------
  // Commands that open the store
  // ------------------------------------------------------------

  std::size_t required = 0;
  if (cmd == "versions" || cmd == "snapshot") required = 1;
  if (cmd == "restore" || cmd == "delete-version" || cmd == "verify") required = 2;
  if (args.size() < required) return 1;

  auto runtime_config = config;
  if (cmd == "migrate") runtime_config.mutable_migration()->set_auto_migrate(true);

  auto runtime = archstore::factory::BuildRuntime(runtime_config);
  int  rc      = 0;

  if (cmd == "migrate") {
    if (runtime.migration) {
      PrintJson(*runtime.migration);
    } else {
      std::cout << "store is at schema " << runtime.catalog->CurrentVersion() << ", no migration required\n";
    }
  } else if (cmd == "versions") {
    archstore::v1::VersionList list;
    for (const auto& version : runtime.versions->ListVersions(args[0])) *list.add_versions() = version;
    PrintJson(list);
  } else if (cmd == "snapshot") {
    PrintJson(runtime.versions->SaveManually(args[0], args.size() >= 2 ? args[1] : "Manual save"));
  } else if (cmd == "restore") {
    PrintJson(runtime.versions->RestoreVersion(RequireVersion(runtime, args[0], args[1]), args[0]));
  } else if (cmd == "delete-version") {
    runtime.versions->DeleteVersion(RequireVersion(runtime, args[0], args[1]));
    std::cout << "deleted version " << args[1] << " of project " << args[0] << "\n";
  } else if (cmd == "verify") {
    const bool ok = runtime.versions->VerifyVersion(RequireVersion(runtime, args[0], args[1]));
    std::cout << (ok ? "ok" : "corrupted") << "\n";
    rc = ok ? 0 : ExitCode(archstore::util::ErrorClass::kCorruption);
  } else if (cmd == "check") {
    bool quick  = false;
    bool repair = false;
    for (const auto& arg : args) {
      if (arg == "--quick") {
        quick = true;
      } else if (arg == "--repair") {
        repair = true;
      } else {
        runtime.Shutdown();
        return 1;
      }
    }
    auto result = quick ? runtime.integrity->RunQuickCheck() : runtime.integrity->RunFullCheck();
    if (repair) {
      PrintJson(runtime.integrity->Repair(archstore::integrity::OutstandingRepairs(result), archstore::v1::REPAIR_TYPE_MANUAL));
    }
    PrintJson(runtime.integrity->GetReport());
    rc = result.valid ? 0 : 8;
  } else if (cmd == "report") {
    runtime.integrity->RunQuickCheck();
    PrintJson(runtime.integrity->GetReport());
  } else {
    rc = 1;
  }

  runtime.Shutdown();
  return rc;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string              config_path = argv[1];
  std::string              cmd         = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = archstore::config::ConfigLoader::LoadFromYaml(config_path);
    archstore::observability::InitializeLogging(config);

    int rc = Run(config, cmd, args);
    if (rc == 1) Usage();
    archstore::observability::ShutdownLogging();
    return rc;
  } catch (const archstore::util::StoreError& e) {
    std::cerr << archstore::util::ErrorClassName(e.Class()) << ": " << e.what() << "\n";
    return ExitCode(e.Class());
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
