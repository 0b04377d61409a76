#include "sessionrelay/sessions/session_key.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <cstdio>

namespace sessionrelay::sessions {

namespace {

constexpr std::size_t FINGERPRINT_LENGTH = 8;

std::string to_hex(const unsigned char *data, std::size_t len) {
  static constexpr char HEX[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out.push_back(HEX[(data[i] >> 4U) & 0x0FU]);
    out.push_back(HEX[data[i] & 0x0FU]);
  }
  return out;
}

} // namespace

std::string workspace_fingerprint(const std::string &workspace_path) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(workspace_path.data(), workspace_path.size(), digest.data(), &digest_len,
                 EVP_md5(), nullptr) != 1 ||
      digest_len < FINGERPRINT_LENGTH / 2) {
    // MD5 can be unavailable under a FIPS-only provider; fall back to FNV-1a so keys stay
    // deterministic.
    std::uint32_t hash = 2166136261U;
    for (const char ch : workspace_path) {
      hash ^= static_cast<unsigned char>(ch);
      hash *= 16777619U;
    }
    char buffer[FINGERPRINT_LENGTH + 1] = {};
    std::snprintf(buffer, sizeof(buffer), "%08x", hash);
    return std::string(buffer);
  }
  return to_hex(digest.data(), digest_len).substr(0, FINGERPRINT_LENGTH);
}

std::string derive_session_key(const std::string &conversation_id, const bool is_group,
                               const std::string &workspace_path, const std::string &prefix) {
  std::string key = prefix;
  key += is_group ? "-group-" : "-";
  key += conversation_id;
  key += "-";
  key += workspace_fingerprint(workspace_path);
  return key;
}

std::string derive_session_key(const Conversation &conversation, const std::string &workspace_path,
                               const std::string &prefix) {
  return derive_session_key(conversation.id, conversation.is_group, workspace_path, prefix);
}

} // namespace sessionrelay::sessions
