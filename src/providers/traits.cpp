#include "ragsync/providers/traits.hpp"

#include "ragsync/common/fs.hpp"
#include "ragsync/common/json_util.hpp"

#include <curl/curl.h>

#include <charconv>
#include <sstream>

namespace ragsync::providers {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

HttpResponse execute_request(const std::string &url, const HttpHeaders &headers,
                             const std::optional<std::string> &body, const bool use_head,
                             const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "ragsync/0.1");

  if (body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  if (use_head) {
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);

  return response;
}

std::optional<std::uint64_t> parse_u64(const std::string &text) {
  std::uint64_t value = 0;
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end || text.empty()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "Provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::AuthError:
    stream << "auth";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return execute_request(url, headers, body, false, timeout_ms);
}

HttpResponse CurlHttpClient::head(const std::string &url, const HttpHeaders &headers,
                                  const std::uint64_t timeout_ms) {
  return execute_request(url, headers, std::nullopt, true, timeout_ms);
}

std::optional<ProviderError> response_error(const HttpResponse &response) {
  if (response.timeout) {
    return ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"};
  }
  if (response.network_error) {
    return ProviderError{.code = ProviderErrorCode::NetworkError,
                         .message = response.network_error_message};
  }
  if (response.status == 401 || response.status == 403) {
    return ProviderError{
        .code = ProviderErrorCode::AuthError, .status = response.status, .message = response.body};
  }
  if (response.status == 404) {
    return ProviderError{.code = ProviderErrorCode::ModelNotFound,
                         .status = response.status,
                         .message = response.body};
  }
  if (response.status == 429) {
    ProviderError error{.code = ProviderErrorCode::RateLimitError,
                        .status = response.status,
                        .message = response.body};
    if (const auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      error.retry_after = parse_u64(common::trim(it->second));
    }
    return error;
  }
  if (response.status < 200 || response.status >= 300) {
    return ProviderError{
        .code = ProviderErrorCode::ApiError, .status = response.status, .message = response.body};
  }
  return std::nullopt;
}

HttpHeaders json_headers(const std::string &api_key) {
  HttpHeaders headers = {{"Content-Type", "application/json"}};
  if (!api_key.empty()) {
    headers["Authorization"] = "Bearer " + api_key;
  }
  return headers;
}

std::string trim_base_url(std::string base_url) {
  while (!base_url.empty() && base_url.back() == '/') {
    base_url.pop_back();
  }
  return base_url;
}

common::Result<std::string> parse_openai_content(const std::string &response) {
  const std::string choices = common::json_get_array(response, "choices");
  if (choices.empty()) {
    return common::Result<std::string>::failure("choices field missing");
  }
  const auto items = common::json_split_top_level_objects(choices);
  if (items.empty()) {
    return common::Result<std::string>::failure("choices array is empty");
  }
  const std::string message = common::json_get_object(items.front(), "message");
  if (message.empty() || common::json_find_key(message, "content") == std::string::npos) {
    return common::Result<std::string>::failure("choices[0].message.content missing");
  }
  return common::Result<std::string>::success(common::json_get_string(message, "content"));
}

common::Result<std::vector<std::vector<float>>>
parse_openai_embeddings(const std::string &response, const std::size_t expected) {
  using ResultT = common::Result<std::vector<std::vector<float>>>;

  const std::string data = common::json_get_array(response, "data");
  if (data.empty()) {
    return ResultT::failure("data field missing");
  }
  const auto items = common::json_split_top_level_objects(data);
  if (items.size() != expected) {
    return ResultT::failure("expected " + std::to_string(expected) + " embeddings, got " +
                            std::to_string(items.size()));
  }

  std::vector<std::vector<float>> out(expected);
  std::vector<bool> filled(expected, false);
  for (std::size_t i = 0; i < items.size(); ++i) {
    std::size_t slot = i;
    const std::string index_text = common::json_get_number(items[i], "index");
    if (!index_text.empty()) {
      const auto parsed = parse_u64(index_text);
      if (!parsed.has_value() || *parsed >= expected) {
        return ResultT::failure("embedding index out of range: " + index_text);
      }
      slot = static_cast<std::size_t>(*parsed);
    }
    if (filled[slot]) {
      return ResultT::failure("duplicate embedding index " + std::to_string(slot));
    }

    auto vector = common::json_parse_float_array(common::json_get_array(items[i], "embedding"));
    if (!vector.ok()) {
      return ResultT::failure("embedding " + std::to_string(slot) + ": " + vector.error());
    }
    out[slot] = std::move(vector.value());
    filled[slot] = true;
  }
  return ResultT::success(std::move(out));
}

} // namespace ragsync::providers
