#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/messaging/message_bus.hpp"
#include "internal/messaging/message_serializer.hpp"
#include "internal/processes/command_publisher.hpp"

namespace outbox::processes {

struct CommandPublisherOptions {
  // owners probed per category on each sweep pass
  std::size_t probe_batch_size = 1;
};

/*
  CommandPublisher over the outbox tables.

  Flush of one instance:
    immediate: load rows, send the batch once, delete each row
               in its own transaction
    scheduled: per row, send then delete

  Rows are deleted only after their send returned. A delete that
  finds the row gone was beaten by a concurrent flush and counts
  as success. Any other failure leaves the remaining rows in place.

  The publisher must outlive every future returned by EnqueueAll().
*/
class RepositoryCommandPublisher final : public CommandPublisher {
 public:
  RepositoryCommandPublisher(std::shared_ptr<db::Repository> repository,
                             std::shared_ptr<const messaging::MessageSerializer> serializer,
                             std::shared_ptr<messaging::MessageBus> bus,
                             std::shared_ptr<messaging::ScheduledMessageBus> scheduled_bus,
                             CommandPublisherOptions options = {});

  void FlushCommands(const util::UUID& process_manager_id, std::stop_token stop) override;

  std::future<void> EnqueueAll(std::stop_token stop) override;

 private:
  void FlushPendingCommands(const std::string& process_manager_id, std::stop_token stop);
  void FlushPendingScheduledCommands(const std::string& process_manager_id, std::stop_token stop);

  void RemoveCommand(uint64_t id);
  void RemoveScheduledCommand(uint64_t id);

  void RunEnqueueAll(std::stop_token stop);

  v1::Envelope RestoreEnvelope(const std::string& message_id,
                               const std::optional<std::string>& correlation_id,
                               const std::string& command_json) const;

  std::shared_ptr<db::Repository>                     repository_;
  std::shared_ptr<const messaging::MessageSerializer> serializer_;
  std::shared_ptr<messaging::MessageBus>              bus_;
  std::shared_ptr<messaging::ScheduledMessageBus>     scheduled_bus_;
  CommandPublisherOptions                             options_;
};

} // namespace outbox::processes
