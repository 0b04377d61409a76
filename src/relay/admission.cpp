#include "sessionrelay/relay/admission.hpp"

#include "sessionrelay/observability/global.hpp"

namespace sessionrelay::relay {

AdmissionSlot::AdmissionSlot(AdmissionGate *gate, std::string conversation_id)
    : gate_(gate), conversation_id_(std::move(conversation_id)) {}

AdmissionSlot::AdmissionSlot(AdmissionSlot &&other) noexcept
    : gate_(other.gate_), conversation_id_(std::move(other.conversation_id_)) {
  other.gate_ = nullptr;
}

AdmissionSlot &AdmissionSlot::operator=(AdmissionSlot &&other) noexcept {
  if (this != &other) {
    release();
    gate_ = other.gate_;
    conversation_id_ = std::move(other.conversation_id_);
    other.gate_ = nullptr;
  }
  return *this;
}

AdmissionSlot::~AdmissionSlot() { release(); }

void AdmissionSlot::release() {
  if (gate_ == nullptr) {
    return;
  }
  AdmissionGate *gate = gate_;
  gate_ = nullptr;
  gate->release(conversation_id_);
}

bool AdmissionGate::try_acquire(const std::string &conversation_id) {
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_.insert(conversation_id).second) {
      return false;
    }
    count = active_.size();
  }
  observability::record_in_flight(count);
  return true;
}

void AdmissionGate::release(const std::string &conversation_id) {
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_.erase(conversation_id) == 0) {
      return;
    }
    count = active_.size();
  }
  observability::record_in_flight(count);
}

std::optional<AdmissionSlot> AdmissionGate::admit(const std::string &conversation_id) {
  if (!try_acquire(conversation_id)) {
    return std::nullopt;
  }
  return AdmissionSlot(this, conversation_id);
}

bool AdmissionGate::is_busy(const std::string &conversation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.count(conversation_id) != 0;
}

std::size_t AdmissionGate::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.size();
}

} // namespace sessionrelay::relay
