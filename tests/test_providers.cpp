#include "test_framework.hpp"

#include "ragsync/providers/compatible.hpp"
#include "ragsync/providers/traits.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_provider_tests(std::vector<ragsync::tests::TestCase> &tests) {
  using ragsync::tests::require;
  namespace providers = ragsync::providers;

  tests.push_back({"response_error_maps_statuses", [] {
                     require(!providers::response_error(providers::HttpResponse{.status = 200})
                                  .has_value(),
                             "200 is not an error");
                     const auto auth =
                         providers::response_error(providers::HttpResponse{.status = 401});
                     require(auth.has_value() && auth->code == providers::ProviderErrorCode::AuthError,
                             "401 should be auth error");
                     providers::HttpResponse limited{.status = 429};
                     limited.headers["retry-after"] = "12";
                     const auto rate = providers::response_error(limited);
                     require(rate.has_value() && rate->retry_after.value_or(0) == 12,
                             "retry-after should be parsed");
                     const auto timeout =
                         providers::response_error(providers::HttpResponse{.timeout = true});
                     require(timeout.has_value() &&
                                 timeout->code == providers::ProviderErrorCode::Timeout,
                             "timeout flag should map to timeout");
                   }});

  tests.push_back({"parse_openai_embeddings_orders_by_index", [] {
                     const std::string body =
                         R"({"data":[{"index":1,"embedding":[0,1]},{"index":0,"embedding":[1,0]}]})";
                     const auto parsed = providers::parse_openai_embeddings(body, 2);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value()[0][0] == 1.0F, "index 0 should be first");
                     require(parsed.value()[1][1] == 1.0F, "index 1 should be second");

                     require(!providers::parse_openai_embeddings(body, 3).ok(),
                             "count mismatch should fail");
                     const std::string dup =
                         R"({"data":[{"index":0,"embedding":[1]},{"index":0,"embedding":[2]}]})";
                     require(!providers::parse_openai_embeddings(dup, 2).ok(),
                             "duplicate index should fail");
                   }});

  tests.push_back({"parse_openai_content_reads_first_choice", [] {
                     const auto parsed = providers::parse_openai_content(
                         R"({"choices":[{"message":{"role":"assistant","content":"Hi there"}}]})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value() == "Hi there", "content mismatch");
                     require(!providers::parse_openai_content(R"({"choices":[]})").ok(),
                             "empty choices should fail");
                   }});

  tests.push_back({"compatible_chat_posts_completion_request", [] {
                     auto http = std::make_shared<ragsync::testing::MockHttpClient>();
                     http->post_responses.push_back(providers::HttpResponse{
                         .status = 200,
                         .body = R"({"choices":[{"message":{"content":"answer"}}]})"});
                     providers::CompatibleChatProvider provider("http://llm:8080/v1/", "key", http);
                     const auto reply = provider.chat(providers::ChatRequest{
                         .model = "m",
                         .messages = {{.role = "user", .content = "q"}},
                         .temperature = 0.3,
                         .max_tokens = 400,
                         .timeout_ms = 1234});
                     require(reply.ok(), reply.error());
                     require(reply.value() == "answer", "reply mismatch");
                     require(http->requests.size() == 1, "one request expected");
                     const auto &request = http->requests.front();
                     require(request.url == "http://llm:8080/v1/chat/completions",
                             "url mismatch: " + request.url);
                     require(request.timeout_ms == 1234, "timeout not forwarded");
                     require(request.headers.at("Authorization") == "Bearer key",
                             "bearer header missing");
                     require(request.body.find("\"max_tokens\":400") != std::string::npos,
                             "max_tokens missing");
                   }});

  tests.push_back({"compatible_chat_maps_failures_to_generation_error", [] {
                     auto http = std::make_shared<ragsync::testing::MockHttpClient>();
                     http->post_responses.push_back(
                         providers::HttpResponse{.status = 503, .body = "busy"});
                     providers::CompatibleChatProvider provider("http://llm", "", http);
                     const auto reply = provider.chat(providers::ChatRequest{.model = "m"});
                     require(!reply.ok(), "503 should fail");
                     require(reply.code() == ragsync::common::ErrorCode::GenerationError,
                             "generation error expected");
                   }});

  tests.push_back({"warmup_treats_any_http_answer_as_reachable", [] {
                     auto http = std::make_shared<ragsync::testing::MockHttpClient>();
                     http->head_response = providers::HttpResponse{.status = 404};
                     providers::CompatibleChatProvider provider("http://llm", "", http);
                     require(provider.warmup(100).ok(), "404 still means reachable");
                     http->head_response =
                         providers::HttpResponse{.network_error = true,
                                                 .network_error_message = "refused"};
                     const auto down = provider.warmup(100);
                     require(!down.ok(), "network error should fail warmup");
                     require(down.code() == ragsync::common::ErrorCode::GenerationError,
                             "generation error expected");
                   }});
}
