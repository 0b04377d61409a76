#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace sessionrelay::relay {

class AdmissionGate;

/// Move-only permit for one conversation. Releases on destruction, exactly once.
class AdmissionSlot {
public:
  AdmissionSlot(AdmissionSlot &&other) noexcept;
  AdmissionSlot &operator=(AdmissionSlot &&other) noexcept;
  AdmissionSlot(const AdmissionSlot &) = delete;
  AdmissionSlot &operator=(const AdmissionSlot &) = delete;
  ~AdmissionSlot();

  void release();
  [[nodiscard]] bool held() const { return gate_ != nullptr; }
  [[nodiscard]] const std::string &conversation_id() const { return conversation_id_; }

private:
  friend class AdmissionGate;
  AdmissionSlot(AdmissionGate *gate, std::string conversation_id);

  AdmissionGate *gate_ = nullptr;
  std::string conversation_id_;
};

/// At most one in-flight request per conversation. Denied requests are dropped, not queued.
class AdmissionGate {
public:
  [[nodiscard]] bool try_acquire(const std::string &conversation_id);
  /// Idempotent; releasing an id that is not held is a no-op.
  void release(const std::string &conversation_id);

  [[nodiscard]] std::optional<AdmissionSlot> admit(const std::string &conversation_id);

  [[nodiscard]] bool is_busy(const std::string &conversation_id) const;
  [[nodiscard]] std::size_t in_flight() const;

private:
  mutable std::mutex mutex_;
  std::unordered_set<std::string> active_;
};

} // namespace sessionrelay::relay
