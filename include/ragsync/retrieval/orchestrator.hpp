#pragma once

#include "ragsync/common/result.hpp"
#include "ragsync/config/schema.hpp"
#include "ragsync/encoder/encoder.hpp"
#include "ragsync/generation/generator.hpp"
#include "ragsync/index/index_handle.hpp"
#include "ragsync/knowledge/knowledge_source.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ragsync::retrieval {

struct RetrievalRequest {
  std::string question;
  std::optional<std::vector<float>> embedding;
  std::optional<std::size_t> k;
};

enum class AnswerMode {
  Generated,
  StoredAnswer,
};

[[nodiscard]] std::string_view answer_mode_name(AnswerMode mode);

struct RetrievalResult {
  std::string answer_text;
  double confidence = 0.0;
  std::vector<std::int64_t> source_ids;
  std::chrono::milliseconds latency{0};
  AnswerMode mode = AnswerMode::StoredAnswer;
  bool hedged = false;
};

struct RetrievalOptions {
  std::size_t top_k = 5;
  double confidence_threshold = 0.65;
  std::string hedging_prefix;

  [[nodiscard]] static RetrievalOptions from_config(const config::RetrievalConfig &config);
};

/// Lowercases ASCII, turns punctuation other than '_' into spaces and collapses whitespace.
[[nodiscard]] std::string normalize_question(std::string_view question);

/// Linear rescale of an inner-product score from [-1, 1] to [0, 1], clamped.
[[nodiscard]] double normalize_confidence(double raw_score);

[[nodiscard]] bool needs_hedging(double confidence, double threshold);

/// "Q: ...\nA: ..." blocks joined by blank lines, in the given order.
[[nodiscard]] std::string build_context(const std::vector<knowledge::KnowledgeEntry> &entries);

class RetrievalOrchestrator {
public:
  RetrievalOrchestrator(encoder::IEncoder &encoder, const index::IndexHandle &handle,
                        knowledge::IKnowledgeSource &source, generation::GeneratorSlot generator,
                        RetrievalOptions options);

  [[nodiscard]] common::Result<RetrievalResult> retrieve(const RetrievalRequest &request);

  [[nodiscard]] const generation::GeneratorSlot &generator() const { return generator_; }
  [[nodiscard]] const RetrievalOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Result<std::vector<float>> query_embedding(const RetrievalRequest &request);
  [[nodiscard]] std::pair<std::string, AnswerMode>
  compose_answer(const std::string &question, const std::vector<knowledge::KnowledgeEntry> &ranked);

  encoder::IEncoder &encoder_;
  const index::IndexHandle &handle_;
  knowledge::IKnowledgeSource &source_;
  generation::GeneratorSlot generator_;
  RetrievalOptions options_;
};

} // namespace ragsync::retrieval
