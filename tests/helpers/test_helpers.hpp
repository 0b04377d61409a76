#pragma once

#include "sessionrelay/config/schema.hpp"
#include "sessionrelay/providers/http.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sessionrelay::testing {

config::Config mock_config();

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::filesystem::path create_dir(const std::string &name) const;
  /// Executable /bin/sh script with `body` after the shebang line.
  [[nodiscard]] std::filesystem::path write_script(const std::string &name,
                                                   const std::string &body) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

/// Scripted HttpClient. Responses are queued per URL fragment; the first queued fragment
/// contained in the request URL answers it. Unmatched requests get `default_response`.
class MockHttpClient final : public providers::HttpClient {
public:
  struct Request {
    std::string method;
    std::string url;
    providers::HttpHeaders headers;
    std::string body;
    std::vector<providers::MultipartField> fields;
    std::uint64_t timeout_ms = 0;
  };

  providers::HttpResponse default_response{.status = 200,
                                           .body = R"({"ok":true,"result":[]})",
                                           .headers = {},
                                           .timeout = false,
                                           .network_error = false,
                                           .network_error_message = ""};

  void respond(std::string url_fragment, providers::HttpResponse response);
  void respond_ok(std::string url_fragment, std::string body);

  [[nodiscard]] providers::HttpResponse post_json(const std::string &url,
                                                  const providers::HttpHeaders &headers,
                                                  const std::string &body,
                                                  std::uint64_t timeout_ms) override;
  [[nodiscard]] providers::HttpResponse
  post_multipart(const std::string &url, const providers::HttpHeaders &headers,
                 const std::vector<providers::MultipartField> &fields,
                 std::uint64_t timeout_ms) override;
  [[nodiscard]] providers::HttpResponse get(const std::string &url,
                                            const providers::HttpHeaders &headers,
                                            std::uint64_t timeout_ms) override;

  [[nodiscard]] std::vector<Request> requests() const;
  /// Requests whose URL contains `fragment`, in order.
  [[nodiscard]] std::vector<Request> requests_to(const std::string &fragment) const;
  bool wait_for_requests(const std::string &fragment, std::size_t count,
                         std::chrono::milliseconds timeout);

private:
  providers::HttpResponse record(Request request);

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::pair<std::string, std::deque<providers::HttpResponse>>> scripted_;
  std::vector<Request> requests_;
};

} // namespace sessionrelay::testing
