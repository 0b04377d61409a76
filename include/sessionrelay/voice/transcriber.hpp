#pragma once

#include "sessionrelay/common/result.hpp"
#include "sessionrelay/providers/http.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace sessionrelay::voice {

struct Transcript {
  std::string raw;
  /// Equal to `raw` when refinement is off.
  std::string refined;
};

class Transcriber {
public:
  virtual ~Transcriber() = default;
  [[nodiscard]] virtual common::Result<Transcript> transcribe(const std::filesystem::path &audio) = 0;
};

struct OpenAiTranscriberConfig {
  std::string api_key;
  std::string api_base = "https://api.openai.com/v1";
  std::string language = "de";
  std::string transcription_model = "whisper-1";
  std::string refine_model = "gpt-4o-mini";
  bool refine = true;
  std::uint64_t timeout_ms = 120000;
};

/// Whisper transcription followed by an optional chat-completion pass that removes filler
/// words and stutters.
class OpenAiTranscriber final : public Transcriber {
public:
  explicit OpenAiTranscriber(OpenAiTranscriberConfig config,
                             std::shared_ptr<providers::HttpClient> http_client =
                                 std::make_shared<providers::CurlHttpClient>());

  [[nodiscard]] common::Result<Transcript> transcribe(const std::filesystem::path &audio) override;

  [[nodiscard]] common::Result<std::string> transcribe_audio(const std::filesystem::path &audio);
  [[nodiscard]] common::Result<std::string> refine(const std::string &transcript);

private:
  [[nodiscard]] providers::HttpHeaders auth_headers() const;

  OpenAiTranscriberConfig config_;
  std::shared_ptr<providers::HttpClient> http_client_;
};

[[nodiscard]] std::string refine_system_prompt();

/// choices[0].message.content of a chat completion response; empty when absent.
[[nodiscard]] std::string parse_completion_content(const std::string &body);

/// Wraps a client/server error body into "<operation> failed: HTTP n: message".
[[nodiscard]] std::string describe_api_error(const providers::HttpResponse &response,
                                             const std::string &operation);

} // namespace sessionrelay::voice
