#include "ragsync/retrieval/orchestrator.hpp"

#include "ragsync/observability/global.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace ragsync::retrieval {

std::string_view answer_mode_name(const AnswerMode mode) {
  switch (mode) {
  case AnswerMode::Generated:
    return "generated";
  case AnswerMode::StoredAnswer:
    return "stored_answer";
  }
  return "unknown";
}

RetrievalOptions RetrievalOptions::from_config(const config::RetrievalConfig &config) {
  return RetrievalOptions{.top_k = config.top_k,
                          .confidence_threshold = config.confidence_threshold,
                          .hedging_prefix = config.hedging_prefix};
}

std::string normalize_question(const std::string_view question) {
  std::string out;
  out.reserve(question.size());
  bool pending_space = false;
  for (const char ch : question) {
    const auto uch = static_cast<unsigned char>(ch);
    const bool separator = std::isspace(uch) != 0 || (std::ispunct(uch) != 0 && ch != '_');
    if (separator) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(uch < 0x80 ? static_cast<char>(std::tolower(uch)) : ch);
  }
  return out;
}

double normalize_confidence(const double raw_score) {
  return std::clamp((raw_score + 1.0) / 2.0, 0.0, 1.0);
}

bool needs_hedging(const double confidence, const double threshold) { return confidence < threshold; }

std::string build_context(const std::vector<knowledge::KnowledgeEntry> &entries) {
  std::string context;
  for (const auto &entry : entries) {
    if (!context.empty()) {
      context += "\n\n";
    }
    context += "Q: " + entry.question + "\nA: " + entry.answer;
  }
  return context;
}

RetrievalOrchestrator::RetrievalOrchestrator(encoder::IEncoder &encoder,
                                             const index::IndexHandle &handle,
                                             knowledge::IKnowledgeSource &source,
                                             generation::GeneratorSlot generator,
                                             RetrievalOptions options)
    : encoder_(encoder), handle_(handle), source_(source), generator_(std::move(generator)),
      options_(std::move(options)) {}

common::Result<std::vector<float>>
RetrievalOrchestrator::query_embedding(const RetrievalRequest &request) {
  if (request.embedding.has_value()) {
    if (request.embedding->size() != encoder_.dimensions()) {
      return common::Result<std::vector<float>>::failure(
          common::ErrorCode::DimensionMismatch,
          "embedding has dimension " + std::to_string(request.embedding->size()) + ", expected " +
              std::to_string(encoder_.dimensions()));
    }
    if (!std::all_of(request.embedding->begin(), request.embedding->end(),
                     [](const float value) { return std::isfinite(value); })) {
      return common::Result<std::vector<float>>::failure(common::ErrorCode::InvalidArgument,
                                                         "embedding has non-finite values");
    }
    return common::Result<std::vector<float>>::success(*request.embedding);
  }

  const std::string normalized = normalize_question(request.question);
  if (normalized.empty()) {
    return common::Result<std::vector<float>>::failure(common::ErrorCode::EncodingError,
                                                       "question is empty");
  }
  return encoder_.encode(normalized);
}

std::pair<std::string, AnswerMode>
RetrievalOrchestrator::compose_answer(const std::string &question,
                                      const std::vector<knowledge::KnowledgeEntry> &ranked) {
  const auto *available = std::get_if<generation::GeneratorAvailable>(&generator_);
  if (available == nullptr) {
    return {ranked.front().answer, AnswerMode::StoredAnswer};
  }

  auto generated = available->generator->generate(question, build_context(ranked));
  if (!generated.ok()) {
    observability::record_error("generator", generated.error());
    observability::record_degraded("retrieval", "answering with the stored answer");
    return {ranked.front().answer, AnswerMode::StoredAnswer};
  }
  return {std::move(generated.value()), AnswerMode::Generated};
}

common::Result<RetrievalResult> RetrievalOrchestrator::retrieve(const RetrievalRequest &request) {
  const auto started = std::chrono::steady_clock::now();

  if (request.k.has_value() && *request.k == 0) {
    return common::Result<RetrievalResult>::failure(common::ErrorCode::InvalidArgument,
                                                    "k must be at least 1");
  }
  const std::size_t k = request.k.value_or(options_.top_k);

  auto embedding = query_embedding(request);
  if (!embedding.ok()) {
    return embedding.forward_failure<RetrievalResult>();
  }

  const auto index = handle_.current();
  if (index == nullptr || index->empty()) {
    return common::Result<RetrievalResult>::failure(common::ErrorCode::NoMatch,
                                                    "the index is empty");
  }

  auto hits = index->search(embedding.value(), k);
  if (!hits.ok()) {
    return hits.forward_failure<RetrievalResult>();
  }
  if (hits.value().empty()) {
    return common::Result<RetrievalResult>::failure(common::ErrorCode::NoMatch, "no match found");
  }

  const auto &scores = hits.value().scores;
  std::vector<std::int64_t> ranked_ids;
  std::unordered_map<std::int64_t, float> score_by_id;
  const auto mapped = index->map_to_source_ids(hits.value().positions);
  for (std::size_t i = 0; i < mapped.size(); ++i) {
    if (mapped[i] != index::kInvalidId && score_by_id.emplace(mapped[i], scores[i]).second) {
      ranked_ids.push_back(mapped[i]);
    }
  }

  auto rows = source_.fetch_entries_by_ids(ranked_ids);
  if (!rows.ok()) {
    return common::Result<RetrievalResult>::failure(common::ErrorCode::SourceUnavailable,
                                                    rows.error());
  }

  std::unordered_map<std::int64_t, knowledge::KnowledgeEntry> by_id;
  for (auto &row : rows.value()) {
    by_id.emplace(row.id, std::move(row));
  }
  std::vector<knowledge::KnowledgeEntry> ranked;
  std::vector<std::int64_t> source_ids;
  for (const auto id : ranked_ids) {
    if (const auto it = by_id.find(id); it != by_id.end()) {
      ranked.push_back(it->second);
      source_ids.push_back(id);
    }
  }
  if (ranked.empty()) {
    return common::Result<RetrievalResult>::failure(
        common::ErrorCode::NoMatch, "matched entries are no longer in the knowledge source");
  }

  auto [answer, mode] = compose_answer(request.question, ranked);

  RetrievalResult result;
  result.source_ids = std::move(source_ids);
  // Rows deactivated since the last rebuild drop out, so the best surviving match sets the score.
  result.confidence = normalize_confidence(score_by_id.at(result.source_ids.front()));
  result.hedged = needs_hedging(result.confidence, options_.confidence_threshold);
  result.answer_text = result.hedged ? options_.hedging_prefix + answer : std::move(answer);
  result.mode = mode;
  result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  observability::record_event(observability::RetrievalEvent{
      .matches = result.source_ids.size(),
      .confidence = result.confidence,
      .hedged = result.hedged,
      .mode = std::string(answer_mode_name(result.mode)),
      .latency = result.latency,
  });
  observability::record_metric(observability::RequestLatencyMetric{.latency = result.latency});
  return common::Result<RetrievalResult>::success(std::move(result));
}

} // namespace ragsync::retrieval
