#include "RateLimitedTransport.hpp"

#include <algorithm>
#include <thread>

RateLimitedTransport::RateLimitedTransport(std::shared_ptr<Transport> inner,
                                           std::chrono::milliseconds interval)
    : inner_{std::move(inner)},
      interval_{interval},
      next_allowed_{std::chrono::steady_clock::now()} {
}

std::optional<HttpResponse> RateLimitedTransport::Get(const URL& url) {
  Dwell();
  return inner_->Get(url);
}

std::optional<HttpResponse> RateLimitedTransport::Stream(const URL& url,
                                                         const BodySink& sink) {
  Dwell();
  return inner_->Stream(url, sink);
}

void RateLimitedTransport::Dwell() {
  if (interval_.count() <= 0)
    return;  // disabled

  using clock = std::chrono::steady_clock;

  clock::time_point slot;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    // Reserve the next slot. max(..) avoids bunching if we were behind.
    slot = std::max(clock::now(), next_allowed_);
    next_allowed_ = slot + interval_;
  }
  std::this_thread::sleep_until(slot);
}
