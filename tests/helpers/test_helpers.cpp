#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <random>

namespace sessionrelay::testing {

config::Config mock_config() {
  config::Config config;
  config.relay.default_workspace = std::filesystem::temp_directory_path().string();
  config.relay.session_prefix = "telegram";
  config.assistant.binary = "claude";
  config.assistant.timeout_seconds = 10;
  config.observability.backend = "none";
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("sessionrelay-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc | std::ios::binary);
  out << content;
}

std::filesystem::path TempWorkspace::create_dir(const std::string &name) const {
  const auto dir = path_ / name;
  std::filesystem::create_directories(dir);
  return dir;
}

std::filesystem::path TempWorkspace::write_script(const std::string &name,
                                                  const std::string &body) const {
  create_file(name, "#!/bin/sh\n" + body);
  const auto script = path_ / name;
  std::filesystem::permissions(script,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec |
                                   std::filesystem::perms::others_read |
                                   std::filesystem::perms::others_exec,
                               std::filesystem::perm_options::replace);
  return script;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

void MockHttpClient::respond(std::string url_fragment, providers::HttpResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[fragment, queue] : scripted_) {
    if (fragment == url_fragment) {
      queue.push_back(std::move(response));
      return;
    }
  }
  scripted_.emplace_back(std::move(url_fragment),
                         std::deque<providers::HttpResponse>{std::move(response)});
}

void MockHttpClient::respond_ok(std::string url_fragment, std::string body) {
  respond(std::move(url_fragment),
          providers::HttpResponse{.status = 200,
                                  .body = std::move(body),
                                  .headers = {},
                                  .timeout = false,
                                  .network_error = false,
                                  .network_error_message = ""});
}

providers::HttpResponse MockHttpClient::record(Request request) {
  std::lock_guard<std::mutex> lock(mutex_);
  providers::HttpResponse response = default_response;
  for (auto &[fragment, queue] : scripted_) {
    if (!queue.empty() && request.url.find(fragment) != std::string::npos) {
      response = queue.front();
      queue.pop_front();
      break;
    }
  }
  requests_.push_back(std::move(request));
  cv_.notify_all();
  return response;
}

providers::HttpResponse MockHttpClient::post_json(const std::string &url,
                                                  const providers::HttpHeaders &headers,
                                                  const std::string &body,
                                                  std::uint64_t timeout_ms) {
  return record(Request{.method = "POST",
                        .url = url,
                        .headers = headers,
                        .body = body,
                        .fields = {},
                        .timeout_ms = timeout_ms});
}

providers::HttpResponse
MockHttpClient::post_multipart(const std::string &url, const providers::HttpHeaders &headers,
                               const std::vector<providers::MultipartField> &fields,
                               std::uint64_t timeout_ms) {
  return record(Request{.method = "MULTIPART",
                        .url = url,
                        .headers = headers,
                        .body = "",
                        .fields = fields,
                        .timeout_ms = timeout_ms});
}

providers::HttpResponse MockHttpClient::get(const std::string &url,
                                            const providers::HttpHeaders &headers,
                                            std::uint64_t timeout_ms) {
  return record(Request{.method = "GET",
                        .url = url,
                        .headers = headers,
                        .body = "",
                        .fields = {},
                        .timeout_ms = timeout_ms});
}

std::vector<MockHttpClient::Request> MockHttpClient::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

std::vector<MockHttpClient::Request>
MockHttpClient::requests_to(const std::string &fragment) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Request> out;
  for (const auto &request : requests_) {
    if (request.url.find(fragment) != std::string::npos) {
      out.push_back(request);
    }
  }
  return out;
}

bool MockHttpClient::wait_for_requests(const std::string &fragment, std::size_t count,
                                       std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [&]() {
    std::size_t seen = 0;
    for (const auto &request : requests_) {
      if (request.url.find(fragment) != std::string::npos) {
        ++seen;
      }
    }
    return seen >= count;
  });
}

} // namespace sessionrelay::testing
