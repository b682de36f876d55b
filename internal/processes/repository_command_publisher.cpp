#include "repository_command_publisher.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace outbox::processes {

namespace {

constexpr std::string_view kImmediate = "immediate";
constexpr std::string_view kScheduled = "scheduled";

void ThrowIfCancelled(const std::stop_token& stop) {
  if (stop.stop_requested()) {
    throw util::Cancelled("command flush cancelled");
  }
}

void ThrowIfDbError(const db::Result& result, std::string_view operation) {
  if (!result) {
    throw std::runtime_error(std::string(operation) + " failed: " + result.message);
  }
}

void AddUnique(std::vector<std::string>& ids, const std::vector<std::string>& more) {
  for (const auto& id : more) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
      ids.push_back(id);
    }
  }
}

} // namespace

RepositoryCommandPublisher::RepositoryCommandPublisher(std::shared_ptr<db::Repository> repository,
                                                       std::shared_ptr<const messaging::MessageSerializer> serializer,
                                                       std::shared_ptr<messaging::MessageBus> bus,
                                                       std::shared_ptr<messaging::ScheduledMessageBus> scheduled_bus,
                                                       CommandPublisherOptions options)
    : repository_(std::move(repository)),
      serializer_(std::move(serializer)),
      bus_(std::move(bus)),
      scheduled_bus_(std::move(scheduled_bus)),
      options_(options) {
  if (!repository_ || !serializer_ || !bus_ || !scheduled_bus_) {
    throw util::InvalidArgument("RepositoryCommandPublisher requires repository, serializer and both buses");
  }
}

void RepositoryCommandPublisher::FlushCommands(const util::UUID& process_manager_id, std::stop_token stop) {
  if (util::IsNil(process_manager_id)) {
    throw util::InvalidArgument("process_manager_id cannot be empty");
  }
  ThrowIfCancelled(stop);

  const auto id = util::ToString(process_manager_id);

  observability::SpanScope span("outbox.flush_commands");
  span.SetAttribute("outbox.process_manager_id", id);

  const auto started = std::chrono::steady_clock::now();
  try {
    FlushPendingCommands(id, stop);
    FlushPendingScheduledCommands(id, stop);
  } catch (const std::exception& e) {
    observability::Metrics::Instance().RecordFlushFailure();
    span.RecordException(e.what());
    throw;
  }

  const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
  observability::Metrics::Instance().ObserveFlushDurationMs(elapsed.count());
}

void RepositoryCommandPublisher::FlushPendingCommands(const std::string& process_manager_id, std::stop_token stop) {
  std::vector<db::model::PendingCommandRecord> rows;
  {
    auto tx = repository_->Begin();
    rows    = repository_->ListPendingCommands(*tx, process_manager_id);
    tx->Commit();
  }
  if (rows.empty()) {
    return;
  }

  std::vector<v1::Envelope> envelopes;
  envelopes.reserve(rows.size());
  for (const auto& row : rows) {
    envelopes.push_back(RestoreEnvelope(row.message_id, row.correlation_id, row.command_json));
  }

  ThrowIfCancelled(stop);
  bus_->Send(envelopes, stop);

  for (const auto& row : rows) {
    ThrowIfCancelled(stop);
    RemoveCommand(row.id);
  }

  observability::Metrics::Instance().RecordCommandsFlushed(kImmediate, rows.size());
  OUTBOX_LOG_DEBUG("flushed pending commands",
                   {observability::StringField("process_manager_id", process_manager_id),
                    observability::IntField("count", static_cast<std::int64_t>(rows.size()))});
}

void RepositoryCommandPublisher::FlushPendingScheduledCommands(const std::string& process_manager_id,
                                                               std::stop_token stop) {
  std::vector<db::model::PendingScheduledCommandRecord> rows;
  {
    auto tx = repository_->Begin();
    rows    = repository_->ListPendingScheduledCommands(*tx, process_manager_id);
    tx->Commit();
  }
  if (rows.empty()) {
    return;
  }

  for (const auto& row : rows) {
    v1::ScheduledEnvelope scheduled;
    *scheduled.mutable_envelope()       = RestoreEnvelope(row.message_id, row.correlation_id, row.command_json);
    *scheduled.mutable_scheduled_time() = util::ToProto(util::FromUnixMillis(row.scheduled_time_ms));

    ThrowIfCancelled(stop);
    scheduled_bus_->Send(scheduled, stop);
    RemoveScheduledCommand(row.id);
  }

  observability::Metrics::Instance().RecordCommandsFlushed(kScheduled, rows.size());
  OUTBOX_LOG_DEBUG("flushed pending scheduled commands",
                   {observability::StringField("process_manager_id", process_manager_id),
                    observability::IntField("count", static_cast<std::int64_t>(rows.size()))});
}

void RepositoryCommandPublisher::RemoveCommand(uint64_t id) {
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->DeletePendingCommand(*tx, id);
    if (result.code == db::ErrorCode::NotFound) {
      observability::Metrics::Instance().RecordAlreadyGoneDelete(kImmediate);
      OUTBOX_LOG_DEBUG("pending command already removed", {observability::IntField("id", static_cast<std::int64_t>(id))});
      return;
    }
    ThrowIfDbError(result, "DeletePendingCommand");
    tx->Commit();
  } catch (const util::ConcurrencyConflict&) {
    observability::Metrics::Instance().RecordAlreadyGoneDelete(kImmediate);
    OUTBOX_LOG_DEBUG("pending command removed concurrently", {observability::IntField("id", static_cast<std::int64_t>(id))});
  }
}

void RepositoryCommandPublisher::RemoveScheduledCommand(uint64_t id) {
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->DeletePendingScheduledCommand(*tx, id);
    if (result.code == db::ErrorCode::NotFound) {
      observability::Metrics::Instance().RecordAlreadyGoneDelete(kScheduled);
      OUTBOX_LOG_DEBUG("pending scheduled command already removed",
                       {observability::IntField("id", static_cast<std::int64_t>(id))});
      return;
    }
    ThrowIfDbError(result, "DeletePendingScheduledCommand");
    tx->Commit();
  } catch (const util::ConcurrencyConflict&) {
    observability::Metrics::Instance().RecordAlreadyGoneDelete(kScheduled);
    OUTBOX_LOG_DEBUG("pending scheduled command removed concurrently",
                     {observability::IntField("id", static_cast<std::int64_t>(id))});
  }
}

v1::Envelope RepositoryCommandPublisher::RestoreEnvelope(const std::string& message_id,
                                                         const std::optional<std::string>& correlation_id,
                                                         const std::string& command_json) const {
  v1::Envelope envelope;
  envelope.set_message_id(message_id);
  if (correlation_id) {
    envelope.set_correlation_id(*correlation_id);
  }
  *envelope.mutable_message() = serializer_->Deserialize(command_json);
  return envelope;
}

std::future<void> RepositoryCommandPublisher::EnqueueAll(std::stop_token stop) {
  return std::async(std::launch::async, [this, stop] { RunEnqueueAll(stop); });
}

void RepositoryCommandPublisher::RunEnqueueAll(std::stop_token stop) {
  observability::SpanScope span("outbox.enqueue_all");

  const auto limit = std::max<std::size_t>(1, options_.probe_batch_size);

  for (;;) {
    ThrowIfCancelled(stop);

    std::vector<std::string> with_commands;
    std::vector<std::string> with_scheduled;
    {
      auto tx        = repository_->Begin();
      with_commands  = repository_->ListProcessManagersWithPendingCommands(*tx, limit);
      with_scheduled = repository_->ListProcessManagersWithPendingScheduledCommands(*tx, limit);
      tx->Commit();
    }
    if (with_commands.empty() && with_scheduled.empty()) {
      return;
    }

    std::vector<std::string> ids = with_commands;
    AddUnique(ids, with_scheduled);

    observability::Metrics::Instance().RecordSweepPass(ids.size());
    span.AddEvent("outbox.sweep_pass");

    std::vector<std::future<void>> flushes;
    flushes.reserve(ids.size());
    for (const auto& id : ids) {
      flushes.push_back(std::async(std::launch::async, [this, id, stop] { FlushCommands(util::FromString(id), stop); }));
    }

    // wait for every flush, then surface the first failure
    std::exception_ptr first_error;
    for (auto& flush : flushes) {
      try {
        flush.get();
      } catch (...) {
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    }
    if (first_error) {
      span.RecordException("sweep flush failed");
      std::rethrow_exception(first_error);
    }
  }
}

} // namespace outbox::processes
