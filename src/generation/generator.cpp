#include "ragsync/generation/generator.hpp"

#include "ragsync/common/fs.hpp"
#include "ragsync/observability/global.hpp"

namespace ragsync::generation {

std::string system_prompt() {
  return "You are a support assistant. Answer the user's question using only the information "
         "in the provided context. If the context does not contain the answer, say so briefly.\n"
         "Links: if the context contains a URL, copy it exactly, character for character. Never "
         "invent, guess or shorten a URL, and never mention a website that does not appear in "
         "the context.\n"
         "Keep the answer concise and factual.";
}

std::string user_prompt(const std::string &question, const std::string &context) {
  return "Context:\n" + context + "\n\nQuestion: " + question;
}

ProviderGenerator::ProviderGenerator(GeneratorOptions options,
                                     std::shared_ptr<providers::HttpClient> http_client)
    : options_(std::move(options)),
      provider_(options_.base_url, options_.api_key, std::move(http_client)) {}

common::Result<std::string> ProviderGenerator::generate(const std::string &question,
                                                        const std::string &context) {
  const providers::ChatRequest request{
      .model = options_.model,
      .messages = {{.role = "system", .content = system_prompt()},
                   {.role = "user", .content = user_prompt(question, context)}},
      .temperature = options_.temperature,
      .max_tokens = options_.max_tokens,
      .timeout_ms = options_.timeout_ms,
  };

  auto response = provider_.chat(request);
  if (!response.ok()) {
    return response;
  }
  std::string text = common::trim(response.value());
  if (text.empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::GenerationError,
                                                "generator returned an empty answer");
  }
  return common::Result<std::string>::success(std::move(text));
}

common::Status ProviderGenerator::warmup() { return provider_.warmup(options_.timeout_ms); }

GeneratorSlot create_generator(const config::Config &config,
                               std::shared_ptr<providers::HttpClient> http_client) {
  const auto &gen = config.generator;
  if (!gen.enabled) {
    observability::record_degraded("generator", "disabled by configuration");
    return GeneratorUnavailable{.reason = "disabled by configuration"};
  }
  if (common::to_lower(gen.provider) != "openai") {
    const std::string reason = "unknown generator.provider: " + gen.provider;
    observability::record_degraded("generator", reason);
    return GeneratorUnavailable{.reason = reason};
  }

  if (http_client == nullptr) {
    http_client = std::make_shared<providers::CurlHttpClient>();
  }
  auto generator = std::make_shared<ProviderGenerator>(
      GeneratorOptions{.base_url = gen.base_url,
                       .api_key = gen.api_key.value_or(""),
                       .model = gen.model,
                       .temperature = gen.temperature,
                       .max_tokens = gen.max_tokens,
                       .timeout_ms = gen.timeout_ms},
      std::move(http_client));

  if (const auto status = generator->warmup(); !status.ok()) {
    observability::record_degraded("generator", status.error());
    return GeneratorUnavailable{.reason = status.error()};
  }
  observability::record_info("generator", "using " + gen.model + " at " + gen.base_url);
  return GeneratorAvailable{.generator = std::move(generator)};
}

bool is_available(const GeneratorSlot &slot) {
  return std::holds_alternative<GeneratorAvailable>(slot);
}

std::string unavailable_reason(const GeneratorSlot &slot) {
  if (const auto *unavailable = std::get_if<GeneratorUnavailable>(&slot); unavailable != nullptr) {
    return unavailable->reason;
  }
  return "";
}

} // namespace ragsync::generation
