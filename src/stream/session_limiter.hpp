#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace edge_stream {

/**
 * @brief Process-wide cap on in-flight sessions.
 *
 * Each session holds one Permit for its whole lifetime, bounding the memory
 * used by accumulating payload buffers. Permits are released when the
 * Permit object is destroyed.
 *
 * Thread Safety:
 *   acquire() and Permit destruction may race freely from handler threads.
 */
class SessionLimiter {
public:
  class Permit {
  public:
    Permit() = default;
    ~Permit();

    Permit(Permit &&other) noexcept;
    Permit &operator=(Permit &&other) noexcept;

    Permit(const Permit &) = delete;
    Permit &operator=(const Permit &) = delete;

    bool valid() const { return owner_ != nullptr; }

    // Give the slot back early. No-op on an empty permit.
    void release();

  private:
    friend class SessionLimiter;
    explicit Permit(SessionLimiter *owner) : owner_(owner) {}

    SessionLimiter *owner_ = nullptr;
  };

  // Throws std::invalid_argument if capacity is 0.
  explicit SessionLimiter(size_t capacity);

  SessionLimiter(const SessionLimiter &) = delete;
  SessionLimiter &operator=(const SessionLimiter &) = delete;

  // Waits up to timeout for a free slot. A zero timeout only tries once.
  std::optional<Permit> acquire(std::chrono::milliseconds timeout);
  std::optional<Permit> try_acquire();

  size_t capacity() const { return capacity_; }
  size_t in_use() const;

private:
  void release_slot();

  const size_t capacity_;
  size_t in_use_ = 0;
  mutable std::mutex mutex_;
  std::condition_variable slot_freed_;
};

} // namespace edge_stream
