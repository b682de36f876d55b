#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/messaging/message_serializer.hpp"
#include "internal/processes/command_publisher.hpp"
#include "internal/processes/exception_handler.hpp"
#include "internal/processes/process_manager.hpp"

namespace outbox::processes {

/*
  Persists process manager transitions together with the commands
  they produced, then flushes them.

  SaveAndPublishCommands:
    1. one transaction: write state (insert at version 0, otherwise
       update guarded by the current version) and insert a pending
       row per drained command
    2. commit; a version conflict raises util::ConcurrencyConflict
       and nothing is flushed
    3. flush the instance; failures go to the exception handler,
       which may suppress them
*/
class ProcessManagerStore {
 public:
  ProcessManagerStore(std::shared_ptr<db::Repository> repository,
                      std::shared_ptr<const messaging::MessageSerializer> serializer,
                      std::shared_ptr<CommandPublisher> publisher,
                      std::shared_ptr<CommandPublisherExceptionHandler> exception_handler = nullptr);

  void SaveAndPublishCommands(ProcessManager& process_manager,
                              const std::optional<std::string>& correlation_id = std::nullopt,
                              std::stop_token stop = {});

  // nullopt when no row exists. Throws util::InvalidArgument for the empty id.
  std::optional<db::model::ProcessManagerRecord> FindRecord(const util::UUID& id);

 private:
  void SaveTransition(ProcessManager& process_manager, const std::optional<std::string>& correlation_id);
  void PublishCommands(const ProcessManager& process_manager, std::stop_token stop);

  std::shared_ptr<db::Repository>                     repository_;
  std::shared_ptr<const messaging::MessageSerializer> serializer_;
  std::shared_ptr<CommandPublisher>                   publisher_;
  std::shared_ptr<CommandPublisherExceptionHandler>   exception_handler_;
};

} // namespace outbox::processes
