#pragma once

#include <cassert>
#include <thread>

namespace ghostlink::utils {

/**
 * Debug-only guard for state that belongs to a single thread.
 *
 * A Session binds its checker when the control thread starts; every method
 * that touches the write path or the state machine then checks it. In release
 * builds (NDEBUG) the class is empty and every call compiles away.
 *
 * Thread Safety:
 *   Not thread-safe itself. It detects misuse, it does not prevent it.
 */
class ThreadChecker {
 public:
#ifndef NDEBUG
  // Starts unbound; an unbound checker accepts any thread.
  ThreadChecker() noexcept = default;

  ThreadChecker(const ThreadChecker&) = delete;
  ThreadChecker& operator=(const ThreadChecker&) = delete;

  void check() const noexcept {
    assert(is_owner_thread() && "ThreadChecker: called from wrong thread!");
  }

  [[nodiscard]] bool is_owner_thread() const noexcept {
    return owner_thread_id_ == std::thread::id{} ||
           std::this_thread::get_id() == owner_thread_id_;
  }

  void bind_to_current() noexcept { owner_thread_id_ = std::this_thread::get_id(); }
  void detach() noexcept { owner_thread_id_ = std::thread::id{}; }

 private:
  std::thread::id owner_thread_id_{};

#else  // NDEBUG

 public:
  ThreadChecker() noexcept = default;
  ThreadChecker(const ThreadChecker&) = delete;
  ThreadChecker& operator=(const ThreadChecker&) = delete;

  void check() const noexcept {}
  [[nodiscard]] static constexpr bool is_owner_thread() noexcept { return true; }
  void bind_to_current() noexcept {}
  void detach() noexcept {}

#endif  // NDEBUG
};

}  // namespace ghostlink::utils

// GHOSTLINK_THREAD_CHECKER(name)      declare a checker member (debug only)
// GHOSTLINK_BIND_THREAD(checker)      bind it to the calling thread
// GHOSTLINK_DCHECK_THREAD(checker)    assert the calling thread owns it
#ifndef NDEBUG
#define GHOSTLINK_THREAD_CHECKER(name) ::ghostlink::utils::ThreadChecker name
#define GHOSTLINK_BIND_THREAD(checker) (checker).bind_to_current()
#define GHOSTLINK_DETACH_THREAD(checker) (checker).detach()
#define GHOSTLINK_DCHECK_THREAD(checker) (checker).check()
#else
#define GHOSTLINK_THREAD_CHECKER(name) static_assert(true, "")
#define GHOSTLINK_BIND_THREAD(checker) ((void)0)
#define GHOSTLINK_DETACH_THREAD(checker) ((void)0)
#define GHOSTLINK_DCHECK_THREAD(checker) ((void)0)
#endif
