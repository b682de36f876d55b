#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace outbox::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

using outbox::runtime::config::ObservabilityConfig;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// empty endpoint keeps the exporter default (OTEL_EXPORTER_OTLP_* or localhost)
std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const ObservabilityConfig& config) {
  if (config.transport() == outbox::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpMetricExporterOptions options;
    if (!config.otlp_endpoint().empty()) options.url = config.otlp_endpoint();
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  if (!config.otlp_endpoint().empty()) options.endpoint = config.otlp_endpoint();
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> commands_flushed;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> already_gone_deletes;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> flush_failures;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> sweep_passes;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> unhandleable_failures;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      flush_duration_ms;
};

bool InitializeMetrics(const outbox::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(observability), reader_options);

  const std::string            service = observability.service_name().empty() ? "outbox-relay" : observability.service_name();
  resource::ResourceAttributes attrs   = {{"service.name", service}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("outbox-relay", "0.1.0");

  impl_->commands_flushed      = impl_->meter->CreateUInt64Counter("outbox.commands.flushed", "Commands handed to a delivery channel", "1");
  impl_->already_gone_deletes  = impl_->meter->CreateUInt64Counter("outbox.delete.already_gone", "Pending rows removed by a concurrent flush", "1");
  impl_->flush_failures        = impl_->meter->CreateUInt64Counter("outbox.flush.failures", "Flushes that ended with an error", "1");
  impl_->sweep_passes          = impl_->meter->CreateUInt64Counter("outbox.sweep.passes", "Sweep probe passes", "1");
  impl_->unhandleable_failures = impl_->meter->CreateUInt64Counter("outbox.handler.unhandleable", "Exception handler failures", "1");
  impl_->flush_duration_ms     = impl_->meter->CreateDoubleHistogram("outbox.flush.duration_ms", "Flush duration in milliseconds", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordCommandsFlushed(std::string_view kind, std::uint64_t count) {
  const std::string                          kind_value(kind);
  const std::initializer_list<AttributePair> attributes = {{"kind", kind_value}};
  impl_->commands_flushed->Add(count, attributes);
}

void Metrics::RecordAlreadyGoneDelete(std::string_view kind) {
  const std::string                          kind_value(kind);
  const std::initializer_list<AttributePair> attributes = {{"kind", kind_value}};
  impl_->already_gone_deletes->Add(1, attributes);
}

void Metrics::RecordFlushFailure() {
  impl_->flush_failures->Add(1);
}

void Metrics::RecordSweepPass(std::uint64_t candidates) {
  const std::initializer_list<AttributePair> attributes = {{"found", candidates > 0}};
  impl_->sweep_passes->Add(1, attributes);
}

void Metrics::RecordUnhandleableFailure() {
  impl_->unhandleable_failures->Add(1);
}

void Metrics::ObserveFlushDurationMs(double duration_ms) {
  impl_->flush_duration_ms->Record(duration_ms, opentelemetry::context::Context{});
}

} // namespace outbox::observability

#endif
