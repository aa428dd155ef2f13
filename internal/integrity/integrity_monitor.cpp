#include "integrity_monitor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace archstore::integrity {

IntegrityMonitor::IntegrityMonitor(std::shared_ptr<IntegrityChecker> checker, std::shared_ptr<events::EventBus> bus,
                                   std::chrono::milliseconds interval)
    : checker_(std::move(checker)), bus_(std::move(bus)), interval_(interval) {
}

IntegrityMonitor::~IntegrityMonitor() {
  Stop();
}

bool IntegrityMonitor::IsSignificant(const events::CommitSummary& summary) {
  return summary.inserted.size() > 5 || summary.deleted.size() > 5 || summary.updated.size() > 10;
}

void IntegrityMonitor::Start() {
  if (running_.exchange(true)) return;

  if (bus_) {
    subscription_ = bus_->commits.Subscribe([this](const events::CommitSummary& summary) {
      if (!IsSignificant(summary)) return;
      {
        std::lock_guard lock(mutex_);
        triggered_ = true;
      }
      cv_.notify_all();
    });
  }
  thread_ = std::thread(&IntegrityMonitor::Run, this);
}

void IntegrityMonitor::Stop() {
  if (bus_ && subscription_ != 0) {
    bus_->commits.Unsubscribe(subscription_);
    subscription_ = 0;
  }
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void IntegrityMonitor::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, interval_, [this] { return !running_ || triggered_; });
    if (!running_) break;
    triggered_ = false;

    lock.unlock();
    try {
      auto result = checker_->RunQuickCheck();
      ++checks_run_;
      if (!result.valid) {
        ARCHSTORE_LOG_WARN("quick integrity check below threshold", {observability::DoubleField("score", result.score),
                                                                      observability::IntField("issues", static_cast<std::int64_t>(result.issues.size()))});
      }
    } catch (const util::StoreError& e) {
      ARCHSTORE_LOG_ERROR("quick integrity check failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace archstore::integrity
