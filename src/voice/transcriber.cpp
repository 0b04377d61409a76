#include "sessionrelay/voice/transcriber.hpp"

#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/common/json_util.hpp"
#include "sessionrelay/observability/global.hpp"

#include <sstream>

namespace sessionrelay::voice {

namespace {

constexpr const char *COMPONENT = "voice";
constexpr double REFINE_TEMPERATURE = 0.3;
constexpr int REFINE_MAX_TOKENS = 2000;

} // namespace

std::string refine_system_prompt() {
  return "Du bist ein Transkriptions-Assistent. Deine Aufgabe ist es, gesprochenen Text zu "
         "bereinigen:\n"
         "\n"
         "1. Entferne Füllwörter (ähm, äh, also, halt, quasi, sozusagen, irgendwie)\n"
         "2. Entferne Wiederholungen und Stotterer\n"
         "3. Korrigiere offensichtliche Spracherkennungsfehler\n"
         "4. Behalte den Inhalt und die Bedeutung exakt bei\n"
         "5. Formatiere als klaren, lesbaren Text\n"
         "6. KEINE Zusammenfassung - der volle Inhalt muss erhalten bleiben\n"
         "\n"
         "Antworte NUR mit dem bereinigten Text, ohne Erklärungen.";
}

std::string parse_completion_content(const std::string &body) {
  auto fields = common::json_parse_flat(body);
  const auto choices = common::json_split_top_level_objects(fields["choices"]);
  if (choices.empty()) {
    return "";
  }
  auto choice = common::json_parse_flat(choices.front());
  auto message = common::json_parse_flat(choice["message"]);
  return message["content"];
}

std::string describe_api_error(const providers::HttpResponse &response,
                               const std::string &operation) {
  if (response.network_error || response.timeout) {
    return operation + " failed: " + providers::describe_failure(response);
  }
  std::string reason = common::json_parse_flat(
      common::json_parse_flat(response.body)["error"])["message"];
  if (reason.empty()) {
    reason = common::trim(response.body);
  }
  std::string out = operation + " failed: HTTP " + std::to_string(response.status);
  if (!reason.empty()) {
    out += ": " + reason;
  }
  return out;
}

OpenAiTranscriber::OpenAiTranscriber(OpenAiTranscriberConfig config,
                                     std::shared_ptr<providers::HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {}

providers::HttpHeaders OpenAiTranscriber::auth_headers() const {
  return {{"Authorization", "Bearer " + config_.api_key}};
}

common::Result<std::string> OpenAiTranscriber::transcribe_audio(const std::filesystem::path &audio) {
  if (config_.api_key.empty()) {
    return common::Result<std::string>::failure("transcription requires an OpenAI API key");
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(audio, ec)) {
    return common::Result<std::string>::failure("audio file not found: " + audio.string());
  }

  observability::record_notice(COMPONENT, "transcribing " + audio.string());
  std::vector<providers::MultipartField> fields = {
      {.name = "file", .value = "", .file_path = audio.string(),
       .filename = audio.filename().string(), .content_type = "audio/ogg"},
      {.name = "model", .value = config_.transcription_model, .file_path = "", .filename = "",
       .content_type = ""},
      {.name = "response_format", .value = "text", .file_path = "", .filename = "",
       .content_type = ""},
  };
  if (!config_.language.empty()) {
    fields.push_back({.name = "language", .value = config_.language, .file_path = "",
                      .filename = "", .content_type = ""});
  }

  const auto response = http_client_->post_multipart(config_.api_base + "/audio/transcriptions",
                                                     auth_headers(), fields, config_.timeout_ms);
  if (!response.ok()) {
    return common::Result<std::string>::failure(describe_api_error(response, "transcription"));
  }
  return common::Result<std::string>::success(common::trim(response.body));
}

common::Result<std::string> OpenAiTranscriber::refine(const std::string &transcript) {
  if (!config_.refine || common::trim(transcript).empty()) {
    return common::Result<std::string>::success(transcript);
  }

  std::ostringstream body;
  body << "{\"model\":\"" << common::json_escape(config_.refine_model) << "\",";
  body << "\"messages\":[";
  body << "{\"role\":\"system\",\"content\":\"" << common::json_escape(refine_system_prompt())
       << "\"},";
  body << "{\"role\":\"user\",\"content\":\"" << common::json_escape(transcript) << "\"}";
  body << "],\"temperature\":" << REFINE_TEMPERATURE << ",\"max_tokens\":" << REFINE_MAX_TOKENS
       << "}";

  const auto response = http_client_->post_json(config_.api_base + "/chat/completions",
                                                auth_headers(), body.str(), config_.timeout_ms);
  if (!response.ok()) {
    return common::Result<std::string>::failure(describe_api_error(response, "refinement"));
  }
  const std::string content = common::trim(parse_completion_content(response.body));
  return common::Result<std::string>::success(content.empty() ? transcript : content);
}

common::Result<Transcript> OpenAiTranscriber::transcribe(const std::filesystem::path &audio) {
  auto raw = transcribe_audio(audio);
  if (!raw.ok()) {
    return common::Result<Transcript>::failure(raw.error());
  }
  auto refined = refine(raw.value());
  if (!refined.ok()) {
    return common::Result<Transcript>::failure(refined.error());
  }
  return common::Result<Transcript>::success(
      Transcript{.raw = raw.value(), .refined = refined.value()});
}

} // namespace sessionrelay::voice
