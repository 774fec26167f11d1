#include "test_framework.hpp"

#include "ragsync/common/vector_math.hpp"
#include "ragsync/encoder/cached_encoder.hpp"
#include "ragsync/encoder/encoder_local.hpp"
#include "ragsync/encoder/encoder_openai.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cmath>

namespace {

double norm(const std::vector<float> &values) {
  return ragsync::common::l2_norm(values.data(), values.size());
}

std::string embeddings_body(const std::vector<std::vector<float>> &vectors) {
  std::string body = R"({"object":"list","data":[)";
  for (std::size_t i = 0; i < vectors.size(); ++i) {
    if (i > 0) {
      body += ",";
    }
    body += R"({"object":"embedding","index":)" + std::to_string(i) + R"(,"embedding":[)";
    for (std::size_t j = 0; j < vectors[i].size(); ++j) {
      if (j > 0) {
        body += ",";
      }
      body += std::to_string(vectors[i][j]);
    }
    body += "]}";
  }
  body += "]}";
  return body;
}

} // namespace

void register_encoder_tests(std::vector<ragsync::tests::TestCase> &tests) {
  using ragsync::tests::require;
  namespace encoder = ragsync::encoder;
  namespace providers = ragsync::providers;
  using ragsync::common::ErrorCode;

  tests.push_back({"local_encoder_unit_norm_and_dimension", [] {
                     encoder::LocalEncoder enc(96);
                     for (const std::string text :
                          {"How do I reset my password?", "x", "???", "Ünïcödé text"}) {
                       const auto result = enc.encode(text);
                       require(result.ok(), result.error());
                       require(result.value().size() == 96, "dimension mismatch for " + text);
                       require(std::fabs(norm(result.value()) - 1.0) < 1e-5,
                               "embedding not unit length for " + text);
                     }
                   }});

  tests.push_back({"local_encoder_is_deterministic_and_discriminative", [] {
                     encoder::LocalEncoder enc(256);
                     const auto a = enc.encode("how do I reset my password");
                     const auto b = enc.encode("how do I reset my password");
                     const auto c = enc.encode("opening hours of the library");
                     require(a.ok() && b.ok() && c.ok(), "encode failed");
                     require(a.value() == b.value(), "same text should give same vector");
                     const float same = ragsync::common::dot(a.value().data(), b.value().data(), 256);
                     const float different =
                         ragsync::common::dot(a.value().data(), c.value().data(), 256);
                     require(same > different, "unrelated text should score lower");
                   }});

  tests.push_back({"blank_input_is_encoding_error", [] {
                     encoder::LocalEncoder enc(16);
                     const auto blank = enc.encode("   ");
                     require(!blank.ok() && blank.code() == ErrorCode::EncodingError,
                             "blank text should fail");
                     const auto empty_batch = enc.encode_batch({});
                     require(!empty_batch.ok() && empty_batch.code() == ErrorCode::EncodingError,
                             "empty batch should fail");
                     const auto mixed = enc.encode_batch({"fine", " "});
                     require(!mixed.ok() && mixed.code() == ErrorCode::EncodingError,
                             "batch with blank entry should fail");
                   }});

  tests.push_back({"openai_encoder_splits_batches_and_normalizes", [] {
                     auto http = std::make_shared<ragsync::testing::MockHttpClient>();
                     http->post_responses.push_back(providers::HttpResponse{
                         .status = 200, .body = embeddings_body({{3, 4, 0}, {0, 0, 2}})});
                     http->post_responses.push_back(providers::HttpResponse{
                         .status = 200, .body = embeddings_body({{1, 1, 1}})});
                     encoder::OpenAiEncoder enc(
                         encoder::OpenAiEncoderOptions{.base_url = "http://emb/v1/",
                                                       .api_key = "k",
                                                       .model = "nomic-embed-text",
                                                       .dimensions = 3,
                                                       .batch_size = 2,
                                                       .timeout_ms = 500},
                         http);
                     const auto result = enc.encode_batch({"a", "b", "c"});
                     require(result.ok(), result.error());
                     require(result.value().size() == 3, "three embeddings expected");
                     require(http->requests.size() == 2, "two slices expected");
                     require(http->requests[0].url == "http://emb/v1/embeddings", "url mismatch");
                     require(http->requests[0].body.find(R"("input":["a","b"])") !=
                                 std::string::npos,
                             "first slice body mismatch: " + http->requests[0].body);
                     require(std::fabs(result.value()[0][0] - 0.6F) < 1e-5F,
                             "vector should be normalized");
                     for (const auto &embedding : result.value()) {
                       require(std::fabs(norm(embedding) - 1.0) < 1e-5, "unit norm expected");
                     }
                   }});

  tests.push_back({"openai_encoder_failures_are_encoding_errors", [] {
                     auto http = std::make_shared<ragsync::testing::MockHttpClient>();
                     encoder::OpenAiEncoder enc(
                         encoder::OpenAiEncoderOptions{.base_url = "http://emb",
                                                       .model = "m",
                                                       .dimensions = 4},
                         http);
                     http->post_responses.push_back(providers::HttpResponse{
                         .network_error = true, .network_error_message = "refused"});
                     const auto offline = enc.encode("hello");
                     require(!offline.ok() && offline.code() == ErrorCode::EncodingError,
                             "network error should be an encoding error");

                     http->post_responses.push_back(providers::HttpResponse{
                         .status = 200, .body = embeddings_body({{1, 0}})});
                     const auto wrong_dim = enc.encode("hello");
                     require(!wrong_dim.ok() && wrong_dim.code() == ErrorCode::EncodingError,
                             "wrong dimension should be an encoding error");

                     http->post_responses.push_back(providers::HttpResponse{
                         .status = 200, .body = embeddings_body({{0, 0, 0, 0}})});
                     const auto zero = enc.encode("hello");
                     require(!zero.ok() && zero.code() == ErrorCode::EncodingError,
                             "zero vector should be an encoding error");
                   }});

  tests.push_back({"cached_encoder_reuses_and_evicts", [] {
                     auto inner = std::make_unique<ragsync::testing::FixedEncoder>(4);
                     auto *fixed = inner.get();
                     fixed->set_fallback({1, 2, 3, 4});
                     encoder::CachedEncoder cached(std::move(inner), 2);

                     require(cached.encode("a").ok(), "first encode failed");
                     require(cached.encode("a").ok(), "second encode failed");
                     require(fixed->calls() == 1, "second call should be cached");
                     require(cached.encode("b").ok() && cached.encode("c").ok(), "encode failed");
                     require(cached.stats().size == 2, "capacity should bound the cache");
                     require(cached.encode("a").ok(), "encode failed");
                     require(fixed->calls() == 4, "oldest entry should have been evicted");
                     require(cached.stats().hits == 1, "one hit expected");
                   }});

  tests.push_back({"create_encoder_selects_provider", [] {
                     ragsync::config::Config config;
                     config.index.dimension = 32;
                     config.encoder.provider = "local";
                     config.encoder.cache_capacity = 0;
                     auto local = encoder::create_encoder(config);
                     require(local.ok(), local.error());
                     require(local.value()->name() == "local", "local encoder expected");
                     require(local.value()->dimensions() == 32, "dimension should follow config");

                     config.encoder.cache_capacity = 8;
                     auto cached = encoder::create_encoder(config);
                     require(cached.ok(), cached.error());
                     require(dynamic_cast<encoder::CachedEncoder *>(cached.value().get()) != nullptr,
                             "cache wrapper expected");

                     config.encoder.provider = "word2vec";
                     const auto unknown = encoder::create_encoder(config);
                     require(!unknown.ok() && unknown.code() == ErrorCode::ConfigError,
                             "unknown provider should be a config error");
                   }});
}
