#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/messaging/message_bus.hpp"
#include "internal/messaging/message_serializer.hpp"
#include "internal/processes/command_publisher.hpp"
#include "internal/processes/process_manager_store.hpp"
#include "internal/sweep/sweep_worker.hpp"

namespace outbox::factory {

/*
  Application

  Owns every long-lived object of the relay. Members are declared in
  dependency order so the sweep worker is destroyed first.
*/
struct Application {
  std::shared_ptr<db::Repository>                     repository;
  std::shared_ptr<const messaging::MessageSerializer> serializer;
  std::shared_ptr<messaging::MessageBus>              bus;
  std::shared_ptr<messaging::ScheduledMessageBus>     scheduled_bus;
  std::shared_ptr<processes::CommandPublisher>        publisher;
  std::shared_ptr<processes::ProcessManagerStore>     store;

  // null when sweep.interval_ms is 0
  std::unique_ptr<sweep::SweepWorker> sweep_worker;
};

/*
  Delivery channels supplied by the host. Null members fall back to
  LoggingMessageBus, which deletes what it logs: on a sqlite or postgres
  store Build refuses the fallback unless publisher.dry_run_discard is set.
*/
struct Channels {
  std::shared_ptr<messaging::MessageBus>          bus;
  std::shared_ptr<messaging::ScheduledMessageBus> scheduled_bus;
};

/*
  Build

  Composition root. The only place that knows concrete backend
  types. Creates the schema when the backend is empty.
*/
Application Build(const outbox::runtime::config::RuntimeConfig& config, Channels channels = {});

// Repository for config.database(); memory when no backend is set.
std::shared_ptr<db::Repository> BuildRepository(const outbox::runtime::config::RuntimeConfig& config);

} // namespace outbox::factory
