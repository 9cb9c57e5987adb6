#pragma once

#include <atomic>

// Cooperative stop flag shared between a scan thread and whoever drives it.
// The walker, the hasher and the engine all poll the same token, so one
// request_stop() halts every layer of a single scan.
class CancellationToken {
public:
  void request_stop() { stop_.store(true, std::memory_order_release); }
  bool stop_requested() const { return stop_.load(std::memory_order_acquire); }
  void reset() { stop_.store(false, std::memory_order_release); }

private:
  std::atomic<bool> stop_{false};
};

inline bool is_cancelled(const CancellationToken* token) {
  return token && token->stop_requested();
}
