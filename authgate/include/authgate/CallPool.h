#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>
#include "Common.h"

namespace authgate {

enum class CallStatus : uint8_t { Ok = 0, Timeout = 1, WouldBlock = 2, Error = 3 };

std::string_view to_string(CallStatus s);

struct CallPoolConfig {
  uint32_t workers{4};
  uint32_t max_inflight{64}; // queued + running
};

// Runs dependency calls on a fixed set of worker threads so the caller stops
// waiting at its timeout. A call that overruns keeps its worker until the
// dependency returns; the destructor waits for those calls.
class CallPool {
 public:
  explicit CallPool(const CallPoolConfig& cfg);
  ~CallPool();

  CallPool(const CallPool&) = delete;
  CallPool& operator=(const CallPool&) = delete;

  // Whatever fn throws is reported as CallStatus::Error with the message in
  // error; out is only written on CallStatus::Ok.
  template <typename R>
  CallStatus run(std::function<R()> fn, TimeMs timeout_ms, R& out, std::string& error);

  uint32_t inflight() const;

 private:
  bool submit(std::function<void()> job);
  // Frees the in-flight slot before the caller is woken.
  void finished();
  void worker_loop();

  CallPoolConfig cfg_{};
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  uint32_t inflight_{0};
  bool stopping_{false};
  std::vector<std::thread> workers_;
};

template <typename R>
CallStatus CallPool::run(std::function<R()> fn, TimeMs timeout_ms, R& out, std::string& error) {
  struct Slot {
    std::mutex mu;
    std::condition_variable cv;
    bool done{false};
    bool failed{false};
    R value{};
    std::string error;
  };
  auto slot = std::make_shared<Slot>();

  bool queued = submit([this, slot, fn = std::move(fn)] {
    R value{};
    std::string err;
    bool failed = false;
    try {
      value = fn();
    } catch (const std::exception& e) {
      failed = true;
      err = e.what();
    } catch (...) {
      failed = true;
      err = "non-standard exception";
    }
    finished();
    std::lock_guard<std::mutex> lock(slot->mu);
    slot->value = std::move(value);
    slot->error = std::move(err);
    slot->failed = failed;
    slot->done = true;
    slot->cv.notify_all();
  });
  if (!queued) return CallStatus::WouldBlock;

  std::unique_lock<std::mutex> lock(slot->mu);
  if (!slot->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                         [&slot] { return slot->done; })) {
    return CallStatus::Timeout;
  }
  if (slot->failed) {
    error = slot->error;
    return CallStatus::Error;
  }
  out = std::move(slot->value);
  return CallStatus::Ok;
}

} // namespace authgate
