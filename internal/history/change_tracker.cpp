#include "change_tracker.hpp"

namespace archstore::history {

ChangeTracker::ChangeTracker(std::shared_ptr<events::EventBus> bus) : bus_(std::move(bus)) {
  if (bus_) subscription_ = bus_->commits.Subscribe([this](const events::CommitSummary& summary) { Record(summary); });
}

ChangeTracker::~ChangeTracker() {
  if (bus_) bus_->commits.Unsubscribe(subscription_);
}

void ChangeTracker::Record(const events::CommitSummary& summary) {
  std::lock_guard lock(mutex_);
  for (const auto& [project_id, changes] : summary.changes_by_project) counts_[project_id] += changes;
}

uint64_t ChangeTracker::Count(const std::string& project_id) const {
  std::lock_guard lock(mutex_);
  auto            it = counts_.find(project_id);
  return it == counts_.end() ? 0 : it->second;
}

void ChangeTracker::Reset(const std::string& project_id) {
  std::lock_guard lock(mutex_);
  counts_.erase(project_id);
}

std::vector<std::string> ChangeTracker::ProjectsAtOrAbove(uint64_t threshold) const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> out;
  for (const auto& [project_id, count] : counts_) {
    if (count >= threshold) out.push_back(project_id);
  }
  return out;
}

} // namespace archstore::history
