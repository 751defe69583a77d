#include "authgate/CallPool.h"
#include <system_error>

namespace authgate {

std::string_view to_string(CallStatus s) {
  switch (s) {
    case CallStatus::Ok: return "ok";
    case CallStatus::Timeout: return "timeout";
    case CallStatus::WouldBlock: return "backpressure";
    case CallStatus::Error: return "error";
  }
  return "error";
}

CallPool::CallPool(const CallPoolConfig& cfg) : cfg_(cfg) {
  uint32_t n = cfg_.workers == 0 ? 1 : cfg_.workers;
  workers_.reserve(n);
  try {
    for (uint32_t i = 0; i < n; ++i) workers_.emplace_back([this] { worker_loop(); });
  } catch (const std::system_error&) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stopping_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) w.join();
    throw;
  }
}

CallPool::~CallPool() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& w : workers_) w.join();
}

uint32_t CallPool::inflight() const {
  std::lock_guard<std::mutex> lock(mu_);
  return inflight_;
}

bool CallPool::submit(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_ || inflight_ >= cfg_.max_inflight) return false;
    ++inflight_;
    queue_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

void CallPool::worker_loop() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) return;
      job = std::move(queue_.front());
      queue_.pop_front();
    }
    job();
  }
}

void CallPool::finished() {
  std::lock_guard<std::mutex> lock(mu_);
  --inflight_;
}

} // namespace authgate
