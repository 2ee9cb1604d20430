#include "internal/lock/sandbox_lock_table.hpp"

namespace bay::lock {

SandboxLockTable::Guard::Guard(std::shared_ptr<Section> section) : section_(std::move(section)), lock_(section_->mutex, std::adopt_lock) {
}

void SandboxLockTable::Guard::PublishSuccess() {
  section_->last_error = nullptr;
  section_->generation.fetch_add(1);
}

void SandboxLockTable::Guard::PublishFailure(std::exception_ptr error) {
  section_->last_error = std::move(error);
  section_->generation.fetch_add(1);
}

std::exception_ptr SandboxLockTable::Guard::FailureSince(uint64_t seen_generation) const {
  if (section_->generation.load() == seen_generation) {
    return nullptr;
  }
  return section_->last_error;
}

std::shared_ptr<SandboxLockTable::Section> SandboxLockTable::SectionFor(const std::string& sandbox_id) {
  std::lock_guard<std::mutex> lock(guard_);
  auto&                       section = sections_[sandbox_id];
  if (!section) {
    section = std::make_shared<Section>();
  }
  return section;
}

std::optional<SandboxLockTable::Guard> SandboxLockTable::Acquire(const std::string& sandbox_id, std::chrono::milliseconds timeout) {
  auto section = SectionFor(sandbox_id);
  if (!section->mutex.try_lock_for(timeout)) {
    return std::nullopt;
  }
  return Guard(std::move(section));
}

std::optional<SandboxLockTable::Guard> SandboxLockTable::TryAcquire(const std::string& sandbox_id) {
  auto section = SectionFor(sandbox_id);
  if (!section->mutex.try_lock()) {
    return std::nullopt;
  }
  return Guard(std::move(section));
}

uint64_t SandboxLockTable::Generation(const std::string& sandbox_id) {
  return SectionFor(sandbox_id)->generation.load();
}

void SandboxLockTable::Prune(const std::string& sandbox_id) {
  std::lock_guard<std::mutex> lock(guard_);
  auto                        it = sections_.find(sandbox_id);
  // the map holds the only reference: no guard alive, no waiter in SectionFor
  if (it != sections_.end() && it->second.use_count() == 1) {
    sections_.erase(it);
  }
}

std::size_t SandboxLockTable::Size() {
  std::lock_guard<std::mutex> lock(guard_);
  return sections_.size();
}

} // namespace bay::lock
