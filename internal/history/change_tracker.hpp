#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/events/event_bus.hpp"

namespace archstore::history {

/*
  Per-project change volume since the last automatic version.

  Fed by the commit channel, so local and remote commits count alike.
*/
class ChangeTracker {
 public:
  explicit ChangeTracker(std::shared_ptr<events::EventBus> bus);
  ~ChangeTracker();

  ChangeTracker(const ChangeTracker&)            = delete;
  ChangeTracker& operator=(const ChangeTracker&) = delete;

  void Record(const events::CommitSummary& summary);

  uint64_t                 Count(const std::string& project_id) const;
  void                     Reset(const std::string& project_id);
  std::vector<std::string> ProjectsAtOrAbove(uint64_t threshold) const;

 private:
  std::shared_ptr<events::EventBus> bus_;
  uint64_t                          subscription_ = 0;

  mutable std::mutex              mutex_;
  std::map<std::string, uint64_t> counts_;
};

} // namespace archstore::history
