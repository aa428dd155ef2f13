#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/history/change_tracker.hpp"
#include "internal/history/version_manager.hpp"
#include "internal/storage/storage_engine.hpp"

namespace archstore::history {

struct AutoSaveOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(30)};
  uint64_t                  threshold = 5;
};

struct AutoSaveResult {
  bool     committed        = false;
  uint32_t versions_created = 0;
  uint32_t deferred         = 0;
};

/*
  Background worker that commits pending view-context changes and takes
  an automatic version once a project has seen `threshold` changes.

  Executes on every tick:
      commit view context -> automatic version per busy project
*/
class AutoSaveWorker {
 public:
  AutoSaveWorker(std::shared_ptr<storage::StorageEngine> engine, std::shared_ptr<VersionManager> versions, std::shared_ptr<ChangeTracker> tracker,
                 AutoSaveOptions options);
  ~AutoSaveWorker();

  void Start();
  void Stop();

  // One pass; exposed so callers and tests can drive it without the thread.
  AutoSaveResult Tick();

 private:
  void Run();

  std::shared_ptr<storage::StorageEngine> engine_;
  std::shared_ptr<VersionManager>         versions_;
  std::shared_ptr<ChangeTracker>          tracker_;
  AutoSaveOptions                         options_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace archstore::history
