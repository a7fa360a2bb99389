#ifndef IMGSAN_STOP_FORWARDER_HPP
#define IMGSAN_STOP_FORWARDER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>
#include <utility>

/**
 * @brief Watches a flag set by a signal handler and calls `on_set` once
 * from a normal thread.
 *
 * The handler itself only stores to a lock-free atomic; anything that may
 * lock or allocate (such as SanitizeEngine::request_stop) runs here.
 */
class StopForwarder {
public:
    StopForwarder(const std::atomic<bool>& flag, std::function<void()> on_set,
                  const std::chrono::milliseconds poll = std::chrono::milliseconds(50))
        : watcher_([&flag, on_set = std::move(on_set), poll](const std::stop_token& st) {
              while (!st.stop_requested()) {
                  if (flag.load()) {
                      on_set();
                      return;
                  }
                  std::this_thread::sleep_for(poll);
              }
          }) {}

    StopForwarder(const StopForwarder&) = delete;
    StopForwarder& operator=(const StopForwarder&) = delete;

private:
    std::jthread watcher_;
};

#endif // IMGSAN_STOP_FORWARDER_HPP
