#pragma once

#include "ragsync/common/result.hpp"
#include "ragsync/config/schema.hpp"
#include "ragsync/providers/compatible.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace ragsync::generation {

/// Writes an answer to `question` grounded in `context`. Failures carry
/// ErrorCode::GenerationError.
class IGenerator {
public:
  virtual ~IGenerator() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::string> generate(const std::string &question,
                                                             const std::string &context) = 0;
};

struct GeneratorOptions {
  std::string base_url;
  std::string api_key;
  std::string model;
  double temperature = 0.3;
  std::uint32_t max_tokens = 400;
  std::uint64_t timeout_ms = 60'000;
};

class ProviderGenerator final : public IGenerator {
public:
  explicit ProviderGenerator(GeneratorOptions options,
                             std::shared_ptr<providers::HttpClient> http_client =
                                 std::make_shared<providers::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override { return "openai-compatible"; }
  [[nodiscard]] common::Result<std::string> generate(const std::string &question,
                                                     const std::string &context) override;

  [[nodiscard]] common::Status warmup();

private:
  GeneratorOptions options_;
  providers::CompatibleChatProvider provider_;
};

struct GeneratorAvailable {
  std::shared_ptr<IGenerator> generator;
};

struct GeneratorUnavailable {
  std::string reason;
};

/// Decided once at startup; retrieval falls back to stored answers when Unavailable.
using GeneratorSlot = std::variant<GeneratorAvailable, GeneratorUnavailable>;

[[nodiscard]] GeneratorSlot create_generator(const config::Config &config,
                                             std::shared_ptr<providers::HttpClient> http_client =
                                                 nullptr);

[[nodiscard]] bool is_available(const GeneratorSlot &slot);
[[nodiscard]] std::string unavailable_reason(const GeneratorSlot &slot);

[[nodiscard]] std::string system_prompt();
[[nodiscard]] std::string user_prompt(const std::string &question, const std::string &context);

} // namespace ragsync::generation
