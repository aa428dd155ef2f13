#include "autosave_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace archstore::history {

AutoSaveWorker::AutoSaveWorker(std::shared_ptr<storage::StorageEngine> engine, std::shared_ptr<VersionManager> versions,
                               std::shared_ptr<ChangeTracker> tracker, AutoSaveOptions options)
    : engine_(std::move(engine)), versions_(std::move(versions)), tracker_(std::move(tracker)), options_(options) {
}

AutoSaveWorker::~AutoSaveWorker() {
  Stop();
}

void AutoSaveWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&AutoSaveWorker::Run, this);
}

void AutoSaveWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void AutoSaveWorker::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, options_.interval, [this] { return !running_; })) break;

    lock.unlock();
    Tick();
    lock.lock();
  }
}

AutoSaveResult AutoSaveWorker::Tick() {
  AutoSaveResult result;
  if (engine_->Failed()) return result;

  auto view = engine_->ViewContext();
  if (view->HasChanges()) {
    try {
      engine_->Commit(view);
      result.committed = true;
    } catch (const util::StoreError& e) {
      ARCHSTORE_LOG_ERROR("auto-save commit failed", {observability::StringField("error", e.what()),
                                                      observability::StringField("class", util::ErrorClassName(e.Class()))});
    }
  }

  for (const auto& project_id : tracker_->ProjectsAtOrAbove(options_.threshold)) {
    const auto changes = tracker_->Count(project_id);
    try {
      versions_->CreateVersion(project_id, archstore::v1::VERSION_TYPE_AUTOMATIC, "Auto-save after " + std::to_string(changes) + " changes");
      tracker_->Reset(project_id);
      ++result.versions_created;
    } catch (const util::TooFrequent& e) {
      // counter is kept; a later tick retries
      ++result.deferred;
      ARCHSTORE_LOG_DEBUG("auto-save deferred", {observability::StringField("project_id", project_id), observability::StringField("reason", e.what())});
    } catch (const util::NotFound&) {
      tracker_->Reset(project_id);
    } catch (const util::StoreError& e) {
      ARCHSTORE_LOG_ERROR("auto-save version failed", {observability::StringField("project_id", project_id),
                                                       observability::StringField("error", e.what())});
    }
  }
  return result;
}

} // namespace archstore::history
