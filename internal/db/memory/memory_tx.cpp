#include "memory_tx.hpp"

#include <mutex>
#include <stdexcept>

namespace outbox::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Record(ReplayStep step) {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
  journal_.push_back(std::move(step));
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }

  std::scoped_lock      lock(repo_.mutex_);
  std::vector<UndoStep> applied;
  applied.reserve(journal_.size());
  try {
    for (auto& step : journal_) {
      applied.push_back(step(repo_.committed_));
    }
  } catch (...) {
    for (auto it = applied.rbegin(); it != applied.rend(); ++it) {
      (*it)(repo_.committed_);
    }
    journal_.clear();
    rolled_back_ = true;
    throw;
  }

  journal_.clear();
  overlay_   = Overlay{};
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  journal_.clear();
  overlay_     = Overlay{};
  rolled_back_ = true;
}

} // namespace outbox::db::memory
