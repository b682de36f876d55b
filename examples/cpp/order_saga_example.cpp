#include <google/protobuf/wrappers.pb.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/processes/process_manager_data_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using outbox::db::model::ProcessManagerRecord;
using outbox::processes::ProcessManager;

// Order fulfilment saga: reserve stock, then wait for payment with a timeout.
class OrderSaga final : public ProcessManager {
 public:
  explicit OrderSaga(const outbox::util::UUID& id, uint64_t version = 0, std::string stage = "new")
      : ProcessManager(id, version), stage_(std::move(stage)) {
  }

  static std::unique_ptr<OrderSaga> Restore(const ProcessManagerRecord& record) {
    return std::make_unique<OrderSaga>(outbox::util::FromString(record.id), record.version, record.state);
  }

  std::string TypeName() const override {
    return "OrderSaga";
  }

  std::string SerializeState() const override {
    return stage_;
  }

  void Start(const std::string& order_id) {
    stage_ = "awaiting-payment";
    AddCommand(Text("reserve-stock:" + order_id));
    AddScheduledCommand(Text("payment-timeout:" + order_id), outbox::util::Now() + std::chrono::minutes(15));
  }

  void PaymentReceived(const std::string& order_id) {
    stage_ = "shipping";
    AddCommand(Text("ship:" + order_id));
  }

  const std::string& Stage() const {
    return stage_;
  }

 private:
  static google::protobuf::StringValue Text(const std::string& value) {
    google::protobuf::StringValue text;
    text.set_value(value);
    return text;
  }

  std::string stage_;
};

} // namespace

int main(int argc, char** argv) {
  // Optional config path; the default runs on the in-memory backend.
  const auto config = argc > 1 ? outbox::config::ConfigLoader::LoadFromYaml(argv[1]) : outbox::runtime::config::RuntimeConfig{};
  outbox::observability::InitializeLogging(config);

  auto app = outbox::factory::Build(config);

  outbox::processes::ProcessManagerDataContext<OrderSaga> sagas(app.store);

  const auto saga_id = outbox::util::GenerateUUID();
  OrderSaga  saga(saga_id);
  saga.Start("order-42");
  sagas.SaveAndPublishCommands(saga, std::string("checkout-7"));

  // A later message handler loads the saga again and advances it.
  auto loaded = sagas.Find(saga_id);
  if (!loaded) {
    std::cerr << "saga not found after save\n";
    return 1;
  }
  loaded->PaymentReceived("order-42");

  try {
    sagas.SaveAndPublishCommands(*loaded, std::string("payment-9"));
  } catch (const outbox::util::ConcurrencyConflict& e) {
    std::cerr << "saga changed concurrently: " << e.what() << '\n';
    return 1;
  }

  // Anything a crash left behind would be delivered here.
  app.publisher->EnqueueAll({}).get();

  std::cout << "saga " << outbox::util::ToString(saga_id) << " at version " << loaded->Version() << " stage " << loaded->Stage() << '\n';
  outbox::observability::ShutdownLogging();
  return 0;
}
