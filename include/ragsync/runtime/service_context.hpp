#pragma once

#include "ragsync/common/result.hpp"
#include "ragsync/config/schema.hpp"
#include "ragsync/encoder/encoder.hpp"
#include "ragsync/generation/generator.hpp"
#include "ragsync/index/index_handle.hpp"
#include "ragsync/knowledge/sqlite_source.hpp"
#include "ragsync/retrieval/orchestrator.hpp"
#include "ragsync/sync/index_builder.hpp"
#include "ragsync/sync/synchronizer.hpp"

#include <memory>
#include <string>

namespace ragsync::runtime {

struct HealthReport {
  std::string encoder;
  std::size_t index_size = 0;
  bool generator_available = false;
  std::string generator_detail;
  bool synchronizer_active = false;
};

/// Optional seams for tests; unset members are built from the config.
struct ServiceDependencies {
  std::shared_ptr<providers::HttpClient> http_client;
  std::unique_ptr<encoder::IEncoder> encoder;
  std::optional<generation::GeneratorSlot> generator;
  std::shared_ptr<const sync::SyncClock> clock;
};

/// Owns every component of a running service and wires them together. The saved index is
/// loaded at startup; a missing or unusable one leaves the service with an empty index until the
/// synchronizer builds it.
class ServiceContext {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<ServiceContext>>
  create(config::Config config, ServiceDependencies deps = {});

  ~ServiceContext();

  ServiceContext(const ServiceContext &) = delete;
  ServiceContext &operator=(const ServiceContext &) = delete;

  [[nodiscard]] common::Result<retrieval::RetrievalResult>
  retrieve(const retrieval::RetrievalRequest &request);
  [[nodiscard]] common::Result<sync::RebuildStats> force_rebuild();
  [[nodiscard]] sync::SyncStatus sync_status() const;
  [[nodiscard]] HealthReport health() const;

  /// No-op when `[sync] enabled = false`.
  void start_sync();
  void stop();

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] knowledge::SqliteKnowledgeSource &source() { return *source_; }
  [[nodiscard]] sync::Synchronizer &synchronizer() { return *synchronizer_; }
  [[nodiscard]] const index::IndexHandle &index() const { return handle_; }

private:
  explicit ServiceContext(config::Config config);

  config::Config config_;
  std::unique_ptr<knowledge::SqliteKnowledgeSource> source_;
  std::unique_ptr<encoder::IEncoder> encoder_;
  index::IndexHandle handle_;
  std::unique_ptr<sync::IndexBuilder> builder_;
  std::unique_ptr<sync::Synchronizer> synchronizer_;
  std::unique_ptr<retrieval::RetrievalOrchestrator> orchestrator_;
};

} // namespace ragsync::runtime
