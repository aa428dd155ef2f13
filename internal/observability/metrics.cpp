#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace archstore::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return "localhost:4317";
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> commit_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> repair_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      migration_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      backup_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   integrity_score_gauge;

  std::mutex score_mutex;
  double     integrity_score{1.0};
};

bool InitializeMetrics(const archstore::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (observability.otlp_endpoint().empty()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = ResolveEndpoint(otlp_config);
  options.use_ssl_credentials = !otlp_config.insecure;
  auto exporter               = otlp::OtlpGrpcMetricExporterFactory::Create(options);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(5000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
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
  impl_->meter  = provider->GetMeter("archstore", "0.1.0");

  impl_->commit_count          = impl_->meter->CreateUInt64Counter("archstore.commit.count", "Durable commits by origin", "1");
  impl_->repair_count          = impl_->meter->CreateUInt64Counter("archstore.repair.count", "Integrity repairs by outcome", "1");
  impl_->migration_duration_ms = impl_->meter->CreateDoubleHistogram("archstore.migration.duration_ms", "Migration duration", "ms");
  impl_->backup_duration_ms    = impl_->meter->CreateDoubleHistogram("archstore.backup.duration_ms", "Backup copy duration", "ms");
  impl_->integrity_score_gauge = impl_->meter->CreateDoubleObservableGauge("archstore.integrity.score", "Last integrity score", "1");
  impl_->integrity_score_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->score_mutex);
        auto double_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<double>>>(result);
        double_result->Observe(impl->integrity_score);
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordCommit(std::string_view origin, bool success) {
  if (!impl_ || !impl_->commit_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"origin", std::string(origin)}, {"success", success}};
  impl_->commit_count->Add(1, attributes);
}

void Metrics::ObserveMigrationDurationMs(bool success, double duration_ms) {
  if (!impl_ || !impl_->migration_duration_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  impl_->migration_duration_ms->Record(duration_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::ObserveBackupDurationMs(std::string_view op, double duration_ms) {
  if (!impl_ || !impl_->backup_duration_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"op", std::string(op)}};
  impl_->backup_duration_ms->Record(duration_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordRepairs(std::string_view repair_type, std::uint64_t repaired, std::uint64_t failed) {
  if (!impl_ || !impl_->repair_count) {
    return;
  }
  const std::initializer_list<AttributePair> ok_attributes   = {{"type", std::string(repair_type)}, {"outcome", "repaired"}};
  const std::initializer_list<AttributePair> fail_attributes = {{"type", std::string(repair_type)}, {"outcome", "failed"}};
  impl_->repair_count->Add(repaired, ok_attributes);
  impl_->repair_count->Add(failed, fail_attributes);
}

void Metrics::SetIntegrityScore(double score) {
  if (!impl_) {
    return;
  }
  std::lock_guard<std::mutex> lock(impl_->score_mutex);
  impl_->integrity_score = score;
}

} // namespace archstore::observability

#endif
