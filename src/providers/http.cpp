#include "sessionrelay/providers/http.hpp"

#include "sessionrelay/common/fs.hpp"

#include <curl/curl.h>

#include <optional>

namespace sessionrelay::providers {

namespace {

constexpr const char *USER_AGENT = "sessionrelay/0.1";
constexpr std::size_t MAX_ERROR_BODY = 300;

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

enum class Method { Get, PostBody, PostMultipart };

HttpResponse execute_request(const Method method, const std::string &url,
                             const HttpHeaders &headers, const std::optional<std::string> &body,
                             const std::vector<MultipartField> *fields,
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
  curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);

  if (method == Method::Get) {
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  } else if (method == Method::PostBody && body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  curl_mime *mime = nullptr;
  if (method == Method::PostMultipart && fields != nullptr) {
    mime = curl_mime_init(curl);
    for (const auto &field : *fields) {
      curl_mimepart *part = curl_mime_addpart(mime);
      curl_mime_name(part, field.name.c_str());
      if (!field.file_path.empty()) {
        curl_mime_filedata(part, field.file_path.c_str());
        if (!field.filename.empty()) {
          curl_mime_filename(part, field.filename.c_str());
        }
      } else {
        curl_mime_data(part, field.value.data(), field.value.size());
      }
      if (!field.content_type.empty()) {
        curl_mime_type(part, field.content_type.c_str());
      }
    }
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
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
  if (mime != nullptr) {
    curl_mime_free(mime);
  }
  curl_easy_cleanup(curl);

  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  HttpHeaders with_type = headers;
  with_type.try_emplace("Content-Type", "application/json");
  return execute_request(Method::PostBody, url, with_type, body, nullptr, timeout_ms);
}

HttpResponse CurlHttpClient::post_multipart(const std::string &url, const HttpHeaders &headers,
                                            const std::vector<MultipartField> &fields,
                                            const std::uint64_t timeout_ms) {
  return execute_request(Method::PostMultipart, url, headers, std::nullopt, &fields, timeout_ms);
}

HttpResponse CurlHttpClient::get(const std::string &url, const HttpHeaders &headers,
                                 const std::uint64_t timeout_ms) {
  return execute_request(Method::Get, url, headers, std::nullopt, nullptr, timeout_ms);
}

std::string describe_failure(const HttpResponse &response) {
  if (response.timeout) {
    return "request timed out";
  }
  if (response.network_error) {
    return "network error: " + response.network_error_message;
  }
  std::string body = common::trim(response.body);
  if (body.size() > MAX_ERROR_BODY) {
    body.resize(MAX_ERROR_BODY);
    body += "...";
  }
  return "HTTP " + std::to_string(response.status) + (body.empty() ? "" : ": " + body);
}

} // namespace sessionrelay::providers
