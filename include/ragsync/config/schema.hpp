#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ragsync::config {

struct IndexConfig {
  std::string path = "~/.ragsync/index/index.bin";
  std::size_t dimension = 768;
};

struct EncoderConfig {
  std::string provider = "openai";
  std::string base_url = "http://localhost:11434/v1";
  std::string model = "nomic-embed-text";
  std::optional<std::string> api_key;
  std::size_t batch_size = 32;
  std::uint64_t timeout_ms = 30'000;
  std::size_t cache_capacity = 1024;
};

struct GeneratorConfig {
  bool enabled = true;
  std::string provider = "openai";
  std::string base_url = "http://localhost:8080/v1";
  std::string model = "gemma-2-2b-it";
  std::optional<std::string> api_key;
  double temperature = 0.3;
  std::uint32_t max_tokens = 400;
  std::uint64_t timeout_ms = 60'000;
};

struct KnowledgeConfig {
  std::string database_path = "~/.ragsync/knowledge.db";
  std::uint64_t busy_timeout_ms = 5'000;
};

struct SyncConfig {
  bool enabled = true;
  std::uint64_t poll_interval_seconds = 60;
  std::uint64_t initial_delay_seconds = 5;
  std::uint64_t source_uptime_threshold_seconds = 300;
  std::uint64_t min_rebuild_interval_seconds = 300;
};

struct RetrievalConfig {
  std::size_t top_k = 5;
  double confidence_threshold = 0.65;
  std::string hedging_prefix =
      "I'm not certain I understood your question, but here is what I can tell you: ";
};

struct ObservabilityConfig {
  std::string backend = "log";
  /// Lowest level the log backend writes: debug, info, warn or error.
  std::string level = "info";
};

struct Config {
  IndexConfig index;
  EncoderConfig encoder;
  GeneratorConfig generator;
  KnowledgeConfig knowledge;
  SyncConfig sync;
  RetrievalConfig retrieval;
  ObservabilityConfig observability;
};

} // namespace ragsync::config
