#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/messaging/json_message_serializer.hpp"
#include "internal/processes/exception_handler.hpp"
#include "internal/processes/process_manager_data_context.hpp"
#include "internal/processes/process_manager_store.hpp"
#include "internal/processes/repository_command_publisher.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/support/outbox_fakes.hpp"

namespace {

using outbox::db::memory::MemoryRepository;
using outbox::messaging::JsonMessageSerializer;
using outbox::processes::CommandPublisherExceptionContext;
using outbox::processes::CommandPublisherExceptionHandler;
using outbox::processes::DefaultCommandPublisherExceptionHandler;
using outbox::processes::HandlerDecision;
using outbox::processes::LoggingCommandPublisherExceptionHandler;
using outbox::processes::ProcessManagerDataContext;
using outbox::processes::ProcessManagerStore;
using outbox::processes::RepositoryCommandPublisher;
using outbox::testing::CountPending;
using outbox::testing::CountPendingScheduled;
using outbox::testing::HookedRepository;
using outbox::testing::OrderProcess;
using outbox::testing::RecordingMessageBus;
using outbox::testing::ShipmentProcess;
using outbox::testing::UnpackText;
namespace util = outbox::util;

class RecordingHandler final : public CommandPublisherExceptionHandler {
 public:
  explicit RecordingHandler(HandlerDecision decision) : decision_(decision) {
  }

  HandlerDecision Handle(const CommandPublisherExceptionContext& context) override {
    contexts.push_back(context);
    return decision_;
  }

  std::vector<CommandPublisherExceptionContext> contexts;

 private:
  HandlerDecision decision_;
};

class ThrowingHandler final : public CommandPublisherExceptionHandler {
 public:
  HandlerDecision Handle(const CommandPublisherExceptionContext&) override {
    throw std::logic_error("handler bug");
  }
};

struct Fixture {
  explicit Fixture(std::shared_ptr<CommandPublisherExceptionHandler> handler = nullptr) {
    auto serializer = std::make_shared<JsonMessageSerializer>();
    publisher       = std::make_shared<RepositoryCommandPublisher>(repository, serializer, bus, bus);
    store           = std::make_shared<ProcessManagerStore>(repository, serializer, publisher, std::move(handler));
  }

  std::optional<outbox::db::model::ProcessManagerRecord> Stored(const util::UUID& id) {
    return store->FindRecord(id);
  }

  std::shared_ptr<MemoryRepository>           memory     = std::make_shared<MemoryRepository>();
  std::shared_ptr<HookedRepository>           repository = std::make_shared<HookedRepository>(memory);
  std::shared_ptr<RecordingMessageBus>        bus        = std::make_shared<RecordingMessageBus>();
  std::shared_ptr<RepositoryCommandPublisher> publisher;
  std::shared_ptr<ProcessManagerStore>        store;
};

void FailSends(RecordingMessageBus& bus) {
  bus.on_send = [](const std::vector<outbox::v1::Envelope>&) { throw util::DeliveryFailure("broker down"); };
}

void TestEmptyIdIsRejected() {
  bool threw = false;
  try {
    OrderProcess process(util::UUID{});
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestPendingCommandsDrainOnce() {
  OrderProcess process(util::GenerateUUID());
  process.Step("a");
  process.Step("b");

  const auto drained = process.FlushPendingCommands();
  assert(drained.size() == 2);
  assert(UnpackText(drained[0]) == "a");
  assert(UnpackText(drained[1]) == "b");
  assert(process.FlushPendingCommands().empty());
}

void TestFirstSaveInsertsAndDelivers() {
  Fixture      f;
  OrderProcess process(util::GenerateUUID());
  process.Step("reserve");
  process.Step("charge");

  f.store->SaveAndPublishCommands(process, std::string("corr-1"));

  assert(process.Version() == 1);
  auto stored = f.Stored(process.Id());
  assert(stored.has_value());
  assert(stored->type == "OrderProcess");
  assert(stored->state == "reserve;charge;");
  assert(stored->version == 1);

  const auto batches = f.bus->Batches();
  assert(batches.size() == 1);
  assert(batches[0].size() == 2);
  assert(UnpackText(batches[0][0].message()) == "reserve");
  assert(UnpackText(batches[0][1].message()) == "charge");
  for (const auto& envelope : batches[0]) {
    assert(envelope.correlation_id() == "corr-1");
    assert(!util::IsNil(util::FromString(envelope.message_id())));
  }
  assert(batches[0][0].message_id() != batches[0][1].message_id());
  assert(CountPending(*f.memory, util::ToString(process.Id())) == 0);
  assert(process.FlushPendingCommands().empty());
}

void TestSaveWithoutCommandsOnlyWritesState() {
  Fixture      f;
  OrderProcess process(util::GenerateUUID(), 0, "idle");

  f.store->SaveAndPublishCommands(process);

  assert(f.Stored(process.Id())->state == "idle");
  assert(f.bus->Batches().empty());
}

void TestLaterSaveAdvancesVersion() {
  Fixture      f;
  OrderProcess process(util::GenerateUUID());
  process.Step("one");
  f.store->SaveAndPublishCommands(process);
  process.Step("two");
  f.store->SaveAndPublishCommands(process);

  assert(process.Version() == 2);
  assert(f.Stored(process.Id())->version == 2);
  assert(f.Stored(process.Id())->state == "one;two;");
  assert(f.bus->Batches().size() == 2);
}

void TestStaleVersionConflictsAndFlushesNothing() {
  Fixture      f;
  const auto   id = util::GenerateUUID();
  OrderProcess seed(id);
  f.store->SaveAndPublishCommands(seed);

  auto first  = OrderProcess::Restore(*f.Stored(id));
  auto second = OrderProcess::Restore(*f.Stored(id));

  first->Step("winner");
  f.store->SaveAndPublishCommands(*first);

  second->Step("loser");
  bool threw = false;
  try {
    f.store->SaveAndPublishCommands(*second);
  } catch (const util::ConcurrencyConflict&) {
    threw = true;
  }
  assert(threw);
  assert(second->Version() == 1);

  assert(f.Stored(id)->state == "winner;");
  assert(f.Stored(id)->version == 2);
  const auto delivered = f.bus->Delivered();
  assert(delivered.size() == 1);
  assert(UnpackText(delivered[0].message()) == "winner");
  assert(CountPending(*f.memory, util::ToString(id)) == 0);
}

void TestDuplicateNewInstanceConflicts() {
  Fixture      f;
  const auto   id = util::GenerateUUID();
  OrderProcess first(id);
  OrderProcess second(id);
  f.store->SaveAndPublishCommands(first);

  second.Step("dup");
  bool threw = false;
  try {
    f.store->SaveAndPublishCommands(second);
  } catch (const util::ConcurrencyConflict&) {
    threw = true;
  }
  assert(threw);
  assert(f.bus->Batches().empty());
}

void TestFailedCommandInsertRollsBackState() {
  Fixture f;
  f.repository->fail_insert_commands = true;

  OrderProcess process(util::GenerateUUID());
  process.Step("reserve");

  bool threw = false;
  try {
    f.store->SaveAndPublishCommands(process);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(process.Version() == 0);
  assert(!f.Stored(process.Id()).has_value());
  assert(f.bus->Batches().empty());
}

void TestScheduledCommandsArePersistedWithTime() {
  Fixture      f;
  OrderProcess process(util::GenerateUUID());
  const auto   when = util::FromUnixMillis(1800000000000);
  process.Remind("payment-timeout", when);

  f.store->SaveAndPublishCommands(process, std::string("corr-2"));

  const auto scheduled = f.bus->Scheduled();
  assert(scheduled.size() == 1);
  assert(UnpackText(scheduled[0].envelope().message()) == "payment-timeout");
  assert(scheduled[0].envelope().correlation_id() == "corr-2");
  assert(util::FromProto(scheduled[0].scheduled_time()) == when);
  assert(CountPendingScheduled(*f.memory, util::ToString(process.Id())) == 0);
}

void TestFlushFailurePropagatesAfterCommit() {
  Fixture f;
  FailSends(*f.bus);

  OrderProcess process(util::GenerateUUID());
  process.Step("reserve");

  bool threw = false;
  try {
    f.store->SaveAndPublishCommands(process);
  } catch (const util::DeliveryFailure&) {
    threw = true;
  }
  assert(threw);

  // the transition is durable and the command waits for the sweep
  assert(process.Version() == 1);
  assert(f.Stored(process.Id())->version == 1);
  assert(CountPending(*f.memory, util::ToString(process.Id())) == 1);

  f.bus->on_send = nullptr;
  f.publisher->EnqueueAll({}).get();
  assert(f.bus->Delivered().size() == 1);
  assert(CountPending(*f.memory, util::ToString(process.Id())) == 0);
}

void TestDefaultHandlerPropagates() {
  DefaultCommandPublisherExceptionHandler handler;
  CommandPublisherExceptionContext        context;
  assert(handler.Handle(context) == HandlerDecision::kPropagate);
}

void TestLoggingHandlerSuppresses() {
  Fixture f(std::make_shared<LoggingCommandPublisherExceptionHandler>());
  FailSends(*f.bus);

  OrderProcess process(util::GenerateUUID());
  process.Step("reserve");
  f.store->SaveAndPublishCommands(process);

  assert(process.Version() == 1);
  assert(CountPending(*f.memory, util::ToString(process.Id())) == 1);
}

void TestHandlerSeesFailureContext() {
  auto    handler = std::make_shared<RecordingHandler>(HandlerDecision::kHandled);
  Fixture f(handler);
  FailSends(*f.bus);

  OrderProcess process(util::GenerateUUID());
  process.Step("reserve");
  f.store->SaveAndPublishCommands(process);

  assert(handler->contexts.size() == 1);
  const auto& context = handler->contexts[0];
  assert(context.process_manager_type == "OrderProcess");
  assert(context.process_manager_id == process.Id());
  assert(context.exception != nullptr);
  assert(context.Message() == "broker down");

  bool rethrown_as_delivery_failure = false;
  try {
    std::rethrow_exception(context.exception);
  } catch (const util::DeliveryFailure&) {
    rethrown_as_delivery_failure = true;
  }
  assert(rethrown_as_delivery_failure);
}

void TestHandlerPropagateDecisionRethrowsOriginal() {
  auto    handler = std::make_shared<RecordingHandler>(HandlerDecision::kPropagate);
  Fixture f(handler);
  FailSends(*f.bus);

  OrderProcess process(util::GenerateUUID());
  process.Step("reserve");

  bool threw = false;
  try {
    f.store->SaveAndPublishCommands(process);
  } catch (const util::DeliveryFailure&) {
    threw = true;
  }
  assert(threw);
  assert(handler->contexts.size() == 1);
}

void TestThrowingHandlerPropagatesOriginal() {
  Fixture f(std::make_shared<ThrowingHandler>());
  FailSends(*f.bus);

  OrderProcess process(util::GenerateUUID());
  process.Step("reserve");

  bool threw = false;
  try {
    f.store->SaveAndPublishCommands(process);
  } catch (const util::DeliveryFailure&) {
    threw = true;
  } catch (const std::logic_error&) {
    assert(false && "handler failure must not replace the flush failure");
  }
  assert(threw);
}

void TestHandlerIsNotCalledOnSuccess() {
  auto    handler = std::make_shared<RecordingHandler>(HandlerDecision::kHandled);
  Fixture f(handler);

  OrderProcess process(util::GenerateUUID());
  process.Step("reserve");
  f.store->SaveAndPublishCommands(process);

  assert(handler->contexts.empty());
}

void TestDataContextFindRestoresSavedInstance() {
  Fixture                                 f;
  ProcessManagerDataContext<OrderProcess> orders(f.store);

  const auto id = util::GenerateUUID();
  assert(orders.Find(id) == nullptr);

  OrderProcess process(id);
  process.Step("reserve");
  orders.SaveAndPublishCommands(process, std::string("corr-3"));

  auto found = orders.Find(id);
  assert(found != nullptr);
  assert(found->Id() == id);
  assert(found->Version() == 1);
  assert(found->State() == "reserve;");

  found->Step("charge");
  orders.SaveAndPublishCommands(*found);
  assert(orders.Find(id)->Version() == 2);
}

void TestDataContextRejectsEmptyId() {
  Fixture                                 f;
  ProcessManagerDataContext<OrderProcess> orders(f.store);

  bool threw = false;
  try {
    (void)orders.Find(util::UUID{});
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestDataContextRejectsOtherType() {
  Fixture                                    f;
  ProcessManagerDataContext<OrderProcess>    orders(f.store);
  ProcessManagerDataContext<ShipmentProcess> shipments(f.store);

  OrderProcess process(util::GenerateUUID());
  orders.SaveAndPublishCommands(process);

  bool threw = false;
  try {
    (void)shipments.Find(process.Id());
  } catch (const util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyIdIsRejected();
  TestPendingCommandsDrainOnce();
  TestFirstSaveInsertsAndDelivers();
  TestSaveWithoutCommandsOnlyWritesState();
  TestLaterSaveAdvancesVersion();
  TestStaleVersionConflictsAndFlushesNothing();
  TestDuplicateNewInstanceConflicts();
  TestFailedCommandInsertRollsBackState();
  TestScheduledCommandsArePersistedWithTime();
  TestFlushFailurePropagatesAfterCommit();
  TestDefaultHandlerPropagates();
  TestLoggingHandlerSuppresses();
  TestHandlerSeesFailureContext();
  TestHandlerPropagateDecisionRethrowsOriginal();
  TestThrowingHandlerPropagatesOriginal();
  TestHandlerIsNotCalledOnSuccess();
  TestDataContextFindRestoresSavedInstance();
  TestDataContextRejectsEmptyId();
  TestDataContextRejectsOtherType();

  std::cout << "outbox_unit_process_manager_store: pass\n";
  return 0;
}
