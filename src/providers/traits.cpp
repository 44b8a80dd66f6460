#include "almanac/providers/traits.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/common/json_util.hpp"

#include <curl/curl.h>

#include <charconv>
#include <sstream>

namespace almanac::providers {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

struct StreamWriteContext {
  std::string *output = nullptr;
  const StreamChunkCallback *on_chunk = nullptr;
};

size_t stream_write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<StreamWriteContext *>(userdata);
  if (context->output != nullptr) {
    context->output->append(ptr, total);
  }
  if (context->on_chunk != nullptr && *context->on_chunk) {
    (*context->on_chunk)(std::string_view(ptr, total));
  }
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

HttpResponse execute_request(const std::string &url,
                             const std::unordered_map<std::string, std::string> &headers,
                             const std::string &body, const std::uint64_t timeout_ms,
                             const StreamChunkCallback *on_chunk = nullptr) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  StreamWriteContext context{.output = &response.body, .on_chunk = on_chunk};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (on_chunk != nullptr) {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
  } else {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  }
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "Almanac/0.1");

  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

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

std::optional<std::size_t> parse_index(const std::string &raw) {
  std::size_t value = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if (ec != std::errc() || ptr == raw.data()) {
    return std::nullopt;
  }
  return value;
}

std::string string_field(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second == "null") {
    return "";
  }
  return it->second;
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

HttpResponse CurlHttpClient::post_json(
    const std::string &url, const std::unordered_map<std::string, std::string> &headers,
    const std::string &body, const std::uint64_t timeout_ms) {
  return execute_request(url, headers, body, timeout_ms);
}

HttpResponse CurlHttpClient::post_json_stream(
    const std::string &url, const std::unordered_map<std::string, std::string> &headers,
    const std::string &body, const std::uint64_t timeout_ms, const StreamChunkCallback &on_chunk) {
  return execute_request(url, headers, body, timeout_ms, &on_chunk);
}

common::Result<std::vector<CompletionChunk>> parse_completion_event(const std::string &event_json) {
  using ChunkList = std::vector<CompletionChunk>;
  const auto fields = common::json_parse_flat(event_json);

  if (const auto error = fields.find("error"); error != fields.end()) {
    std::string message = common::json_get_string(error->second, "message");
    if (message.empty()) {
      message = error->second;
    }
    return common::Result<ChunkList>::failure(common::ErrorKind::Provider, message);
  }

  const auto choices = fields.find("choices");
  if (choices == fields.end() || choices->second.empty() || choices->second.front() != '[') {
    return common::Result<ChunkList>::failure(common::ErrorKind::Provider,
                                              "choices field missing");
  }

  ChunkList chunks;
  const auto choice_objects = common::json_split_top_level_objects(choices->second);
  for (std::size_t position = 0; position < choice_objects.size(); ++position) {
    const auto choice = common::json_parse_flat(choice_objects[position]);
    const std::size_t entry = parse_index(string_field(choice, "index")).value_or(position);

    std::string body = string_field(choice, "delta");
    const bool streamed = !body.empty();
    if (!streamed) {
      body = string_field(choice, "message");
    }
    if (body.empty() || body.front() != '{') {
      continue;
    }

    const auto delta = common::json_parse_flat(body);
    std::string reasoning = string_field(delta, "reasoning_content");
    if (reasoning.empty()) {
      reasoning = string_field(delta, "reasoning");
    }
    CompletionChunk text{.entry = entry,
                         .role = string_field(delta, "role"),
                         .content = string_field(delta, "content"),
                         .reasoning = std::move(reasoning),
                         .streamed = streamed};
    if (!text.role.empty() || !text.content.empty() || !text.reasoning.empty()) {
      chunks.push_back(std::move(text));
    }

    const std::string calls = string_field(delta, "tool_calls");
    if (calls.empty() || calls.front() != '[') {
      continue;
    }
    const auto call_objects = common::json_split_top_level_objects(calls);
    for (std::size_t i = 0; i < call_objects.size(); ++i) {
      const auto call = common::json_parse_flat(call_objects[i]);
      const auto function = common::json_parse_flat(string_field(call, "function"));
      ToolCallFragment fragment{.index = parse_index(string_field(call, "index")).value_or(i),
                                .id = string_field(call, "id"),
                                .name = string_field(function, "name"),
                                .arguments = string_field(function, "arguments")};
      chunks.push_back(CompletionChunk{
          .entry = entry, .tool_call = std::move(fragment), .streamed = streamed});
    }
  }
  return common::Result<ChunkList>::success(std::move(chunks));
}

} // namespace almanac::providers
