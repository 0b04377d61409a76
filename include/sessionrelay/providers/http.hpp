#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sessionrelay::providers {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HttpHeaders headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool ok() const { return !network_error && status >= 200 && status < 300; }
};

/// One multipart/form-data field. A non-empty `file_path` uploads that file instead of
/// `value`.
struct MultipartField {
  std::string name;
  std::string value;
  std::string file_path;
  std::string filename;
  std::string content_type;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_multipart(const std::string &url,
                                                    const HttpHeaders &headers,
                                                    const std::vector<MultipartField> &fields,
                                                    std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                         std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_multipart(const std::string &url, const HttpHeaders &headers,
                                            const std::vector<MultipartField> &fields,
                                            std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                 std::uint64_t timeout_ms) override;
};

/// Short human-readable description of a failed response, for logs and error messages.
[[nodiscard]] std::string describe_failure(const HttpResponse &response);

} // namespace sessionrelay::providers
