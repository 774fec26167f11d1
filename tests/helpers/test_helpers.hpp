#pragma once

#include "ragsync/config/schema.hpp"
#include "ragsync/encoder/encoder.hpp"
#include "ragsync/generation/generator.hpp"
#include "ragsync/knowledge/knowledge_source.hpp"
#include "ragsync/observability/observer.hpp"
#include "ragsync/providers/traits.hpp"
#include "ragsync/sync/clock.hpp"

#include <atomic>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ragsync::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Local encoder, no generator, no background delay, everything stored under `workspace`.
config::Config temp_config(const TempWorkspace &workspace, std::size_t dimension = 64);

/// Unit vector along `axis`, optionally mixed with a second axis.
std::vector<float> basis(std::size_t dimension, std::size_t axis);
std::vector<float> blend(std::size_t dimension, std::size_t axis_a, float weight_a,
                         std::size_t axis_b, float weight_b);

class MockHttpClient final : public providers::HttpClient {
public:
  struct Request {
    std::string method;
    std::string url;
    providers::HttpHeaders headers;
    std::string body;
    std::uint64_t timeout_ms = 0;
  };

  std::deque<providers::HttpResponse> post_responses;
  providers::HttpResponse head_response{.status = 200};
  std::vector<Request> requests;

  [[nodiscard]] providers::HttpResponse post_json(const std::string &url,
                                                  const providers::HttpHeaders &headers,
                                                  const std::string &body,
                                                  std::uint64_t timeout_ms) override;
  [[nodiscard]] providers::HttpResponse head(const std::string &url,
                                             const providers::HttpHeaders &headers,
                                             std::uint64_t timeout_ms) override;
};

/// Knowledge source held in memory. Modification times are set explicitly by the test.
class MemoryKnowledgeSource final : public knowledge::IKnowledgeSource {
public:
  void put(std::int64_t id, std::string question, std::string answer,
           common::TimePoint modified = common::from_unix_ms(1'000));
  void set_active(std::int64_t id, bool active);
  void set_uptime_seconds(std::int64_t seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    uptime_seconds_ = seconds;
  }
  void set_available(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
  }

  [[nodiscard]] std::string_view name() const override { return "memory"; }
  [[nodiscard]] common::Result<std::vector<knowledge::KnowledgeEntry>>
  list_active_entries() override;
  [[nodiscard]] common::Result<std::optional<common::TimePoint>>
  max_modification_timestamp_of_active_entries() override;
  [[nodiscard]] common::Result<std::int64_t> source_uptime_seconds() override;
  [[nodiscard]] common::Result<std::vector<knowledge::KnowledgeEntry>>
  fetch_entries_by_ids(const std::vector<std::int64_t> &ids) override;

  [[nodiscard]] std::size_t list_calls() const { return list_calls_.load(); }

private:
  [[nodiscard]] common::Status check_available() const;

  mutable std::mutex mutex_;
  std::vector<knowledge::KnowledgeEntry> entries_;
  std::int64_t uptime_seconds_ = 100'000;
  bool available_ = true;
  std::atomic<std::size_t> list_calls_{0};
};

/// Returns registered vectors for exact texts, or the fallback vector when one is set.
class FixedEncoder final : public encoder::IEncoder {
public:
  explicit FixedEncoder(std::size_t dimensions) : dimensions_(dimensions) {}

  void set(const std::string &text, std::vector<float> vector);
  void set_fallback(std::vector<float> vector) { fallback_ = std::move(vector); }
  void set_failing(bool failing) { failing_ = failing; }

  [[nodiscard]] std::string_view name() const override { return "fixed"; }
  [[nodiscard]] common::Result<encoder::Embedding> encode(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<encoder::Embedding>>
  encode_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

  [[nodiscard]] std::size_t calls() const { return calls_.load(); }

private:
  std::size_t dimensions_;
  std::unordered_map<std::string, std::vector<float>> vectors_;
  std::optional<std::vector<float>> fallback_;
  bool failing_ = false;
  std::atomic<std::size_t> calls_{0};
};

class ScriptedGenerator final : public generation::IGenerator {
public:
  void set_response(std::string response);
  void set_error(std::string message);

  [[nodiscard]] std::string_view name() const override { return "scripted"; }
  [[nodiscard]] common::Result<std::string> generate(const std::string &question,
                                                     const std::string &context) override;

  std::string last_question;
  std::string last_context;
  std::size_t calls = 0;

private:
  std::optional<std::string> response_;
  std::optional<std::string> error_;
};

class ManualSyncClock final : public sync::SyncClock {
public:
  explicit ManualSyncClock(common::TimePoint start = common::from_unix_ms(1'700'000'000'000))
      : now_(start) {}

  [[nodiscard]] common::TimePoint now() const override;
  void advance(std::chrono::seconds delta);

private:
  mutable std::mutex mutex_;
  common::TimePoint now_;
};

/// Keeps every event so tests can assert on what was reported.
class CapturingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "capture"; }

  template <typename T> [[nodiscard]] std::vector<T> events_of() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out;
    for (const auto &event : events_) {
      if (const auto *typed = std::get_if<T>(&event)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  [[nodiscard]] std::size_t metric_count() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a CapturingObserver as the global observer and restores a no-op one on exit.
class ObserverScope {
public:
  ObserverScope();
  ~ObserverScope();

  ObserverScope(const ObserverScope &) = delete;
  ObserverScope &operator=(const ObserverScope &) = delete;

  [[nodiscard]] CapturingObserver &observer() { return *observer_; }

private:
  CapturingObserver *observer_;
};

} // namespace ragsync::testing
