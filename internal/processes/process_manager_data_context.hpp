#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/processes/process_manager_store.hpp"
#include "internal/util/errors.hpp"

namespace outbox::processes {

/*
  Typed access to one process manager type.

  T derives from ProcessManager and provides
    static std::unique_ptr<T> Restore(const db::model::ProcessManagerRecord&)
*/
template <typename T>
class ProcessManagerDataContext {
  static_assert(std::is_base_of_v<ProcessManager, T>, "T must derive from ProcessManager");

 public:
  explicit ProcessManagerDataContext(std::shared_ptr<ProcessManagerStore> store) : store_(std::move(store)) {
    if (!store_) {
      throw util::InvalidArgument("ProcessManagerDataContext requires a store");
    }
  }

  // nullptr when no instance with this id was ever saved
  std::unique_ptr<T> Find(const util::UUID& id) {
    auto record = store_->FindRecord(id);
    if (!record) {
      return nullptr;
    }
    std::unique_ptr<T> process_manager = T::Restore(*record);
    if (!process_manager || process_manager->TypeName() != record->type) {
      throw util::InvalidState("process manager " + record->id + " has type " + record->type);
    }
    return process_manager;
  }

  void SaveAndPublishCommands(T& process_manager,
                              const std::optional<std::string>& correlation_id = std::nullopt,
                              std::stop_token stop = {}) {
    store_->SaveAndPublishCommands(process_manager, correlation_id, stop);
  }

 private:
  std::shared_ptr<ProcessManagerStore> store_;
};

} // namespace outbox::processes
