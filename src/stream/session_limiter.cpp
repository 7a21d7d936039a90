#include "stream/session_limiter.hpp"

#include <stdexcept>

namespace edge_stream {

SessionLimiter::Permit::~Permit() { release(); }

SessionLimiter::Permit::Permit(Permit &&other) noexcept
    : owner_(other.owner_) {
  other.owner_ = nullptr;
}

SessionLimiter::Permit &
SessionLimiter::Permit::operator=(Permit &&other) noexcept {
  if (this != &other) {
    release();
    owner_ = other.owner_;
    other.owner_ = nullptr;
  }
  return *this;
}

void SessionLimiter::Permit::release() {
  if (owner_) {
    owner_->release_slot();
    owner_ = nullptr;
  }
}

SessionLimiter::SessionLimiter(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("session capacity must be > 0");
  }
}

std::optional<SessionLimiter::Permit>
SessionLimiter::acquire(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool got = slot_freed_.wait_for(
      lock, timeout, [this] { return in_use_ < capacity_; });
  if (!got) {
    return std::nullopt;
  }
  ++in_use_;
  return Permit(this);
}

std::optional<SessionLimiter::Permit> SessionLimiter::try_acquire() {
  return acquire(std::chrono::milliseconds(0));
}

size_t SessionLimiter::in_use() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_use_;
}

void SessionLimiter::release_slot() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ > 0) {
      --in_use_;
    }
  }
  slot_freed_.notify_one();
}

} // namespace edge_stream
