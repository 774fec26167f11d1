#include "ragsync/runtime/service_context.hpp"

#include "ragsync/config/config.hpp"
#include "ragsync/observability/global.hpp"

namespace ragsync::runtime {

ServiceContext::ServiceContext(config::Config config) : config_(std::move(config)) {}

ServiceContext::~ServiceContext() { stop(); }

common::Result<std::unique_ptr<ServiceContext>> ServiceContext::create(config::Config config,
                                                                       ServiceDependencies deps) {
  using ContextResult = common::Result<std::unique_ptr<ServiceContext>>;
  const auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return validated.forward_failure<std::unique_ptr<ServiceContext>>();
  }
  for (const auto &warning : validated.value()) {
    observability::record_warning("config", warning);
  }

  std::unique_ptr<ServiceContext> context(new ServiceContext(std::move(config)));
  const auto &cfg = context->config_;

  context->source_ = std::make_unique<knowledge::SqliteKnowledgeSource>(
      cfg.knowledge.database_path, cfg.knowledge.busy_timeout_ms);
  if (const auto init = context->source_->initialize(); !init.ok()) {
    return ContextResult::failure(init);
  }

  if (deps.encoder != nullptr) {
    context->encoder_ = std::move(deps.encoder);
  } else {
    auto encoder = encoder::create_encoder(cfg, deps.http_client);
    if (!encoder.ok()) {
      return encoder.forward_failure<std::unique_ptr<ServiceContext>>();
    }
    context->encoder_ = std::move(encoder.value());
  }
  if (context->encoder_->dimensions() != cfg.index.dimension) {
    return ContextResult::failure(common::ErrorCode::ConfigError,
                                  "encoder produces dimension " +
                                      std::to_string(context->encoder_->dimensions()) +
                                      ", index is configured for " +
                                      std::to_string(cfg.index.dimension));
  }

  if (auto loaded = index::VectorIndex::load(cfg.index.path, cfg.index.dimension);
      loaded.has_value()) {
    observability::record_info("index", "loaded " + std::to_string(loaded->size()) +
                                            " vectors from " + cfg.index.path);
    context->handle_.publish(std::make_shared<const index::VectorIndex>(std::move(*loaded)));
  } else {
    context->handle_.publish(std::make_shared<const index::VectorIndex>(
        index::VectorIndex::create_empty(cfg.index.dimension)));
  }

  context->builder_ = std::make_unique<sync::IndexBuilder>(
      *context->source_, *context->encoder_, context->handle_, cfg.index.path,
      cfg.index.dimension);

  auto clock = deps.clock != nullptr ? deps.clock : std::make_shared<sync::SystemSyncClock>();
  context->synchronizer_ = std::make_unique<sync::Synchronizer>(
      *context->source_, *context->builder_, context->handle_,
      sync::SyncOptions::from_config(cfg.sync), std::move(clock));

  auto generator = deps.generator.has_value()
                       ? std::move(*deps.generator)
                       : generation::create_generator(cfg, deps.http_client);
  context->orchestrator_ = std::make_unique<retrieval::RetrievalOrchestrator>(
      *context->encoder_, context->handle_, *context->source_, std::move(generator),
      retrieval::RetrievalOptions::from_config(cfg.retrieval));

  return ContextResult::success(std::move(context));
}

common::Result<retrieval::RetrievalResult>
ServiceContext::retrieve(const retrieval::RetrievalRequest &request) {
  return orchestrator_->retrieve(request);
}

common::Result<sync::RebuildStats> ServiceContext::force_rebuild() {
  return synchronizer_->force_rebuild();
}

sync::SyncStatus ServiceContext::sync_status() const { return synchronizer_->status(); }

HealthReport ServiceContext::health() const {
  const auto &slot = orchestrator_->generator();
  HealthReport report;
  report.encoder = std::string(encoder_->name());
  report.index_size = handle_.size();
  report.generator_available = generation::is_available(slot);
  report.generator_detail = report.generator_available ? config_.generator.model
                                                       : generation::unavailable_reason(slot);
  report.synchronizer_active = synchronizer_->is_running();
  return report;
}

void ServiceContext::start_sync() {
  if (!config_.sync.enabled) {
    observability::record_info("sync", "synchronizer disabled by config");
    return;
  }
  synchronizer_->start();
}

void ServiceContext::stop() {
  if (synchronizer_ != nullptr) {
    synchronizer_->stop();
  }
}

} // namespace ragsync::runtime
