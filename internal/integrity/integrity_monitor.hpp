#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/events/event_bus.hpp"
#include "internal/integrity/integrity_checker.hpp"

namespace archstore::integrity {

/*
  Periodically runs quick checks.

  A commit with significant volume (more than 5 inserts, 5 deletes or 10
  updates) wakes the worker early.
*/
class IntegrityMonitor {
 public:
  IntegrityMonitor(std::shared_ptr<IntegrityChecker> checker, std::shared_ptr<events::EventBus> bus, std::chrono::milliseconds interval);
  ~IntegrityMonitor();

  void Start();
  void Stop();

  static bool IsSignificant(const events::CommitSummary& summary);

  uint64_t ChecksRun() const {
    return checks_run_.load();
  }

 private:
  void Run();

  std::shared_ptr<IntegrityChecker> checker_;
  std::shared_ptr<events::EventBus> bus_;
  std::chrono::milliseconds         interval_;
  uint64_t                          subscription_ = 0;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    triggered_ = false;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::atomic<uint64_t>   checks_run_{0};
};

} // namespace archstore::integrity
