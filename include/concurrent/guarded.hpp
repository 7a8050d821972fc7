#ifndef LEDGER_GUARDED_HPP_
#define LEDGER_GUARDED_HPP_

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace ledger {
namespace concurrent {

/**
 * Pairs a value with the reader/writer lock that guards it.
 * The value is only reachable through a handle that holds the lock, so a
 * caller cannot touch the container without the matching lock held.
 */
template<typename T>
class Guarded {
 public:
  /**
   * Shared (read) access. Many readers may hold one at the same time.
   */
  class ReadHandle {
   public:
    explicit ReadHandle(const Guarded& owner)
        : lock_(owner.mutex_), value_(&owner.value_) {}

    const T& operator*() const { return *value_; }
    const T* operator->() const { return value_; }

   private:
    std::shared_lock<std::shared_mutex> lock_;
    const T* value_;
  };

  /**
   * Exclusive (write) access.
   */
  class WriteHandle {
   public:
    explicit WriteHandle(Guarded& owner)
        : lock_(owner.mutex_), value_(&owner.value_) {}

    T& operator*() const { return *value_; }
    T* operator->() const { return value_; }

   private:
    std::unique_lock<std::shared_mutex> lock_;
    T* value_;
  };

  template<typename... Args>
  explicit Guarded(Args&&... args) : value_(std::forward<Args>(args)...) {}

  // Non-copyable
  Guarded(const Guarded&) = delete;
  Guarded& operator=(const Guarded&) = delete;

  ReadHandle read() const { return ReadHandle(*this); }
  WriteHandle write() { return WriteHandle(*this); }

 private:
  mutable std::shared_mutex mutex_;
  T value_;
};

}  // namespace concurrent
}  // namespace ledger

#endif  // LEDGER_GUARDED_HPP_
