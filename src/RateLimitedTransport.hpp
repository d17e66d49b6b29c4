#pragma once

#include <chrono>
#include <memory>
#include <mutex>

#include "Transport.hpp"

/// Decorator that spaces requests at least `interval` apart. Every caller
/// sharing one instance shares one request budget.
class RateLimitedTransport : public Transport {
 public:
  RateLimitedTransport(std::shared_ptr<Transport> inner,
                       std::chrono::milliseconds interval);

  std::optional<HttpResponse> Get(const URL& url) override;
  std::optional<HttpResponse> Stream(const URL& url,
                                     const BodySink& sink) override;

 private:
  void Dwell();

  std::shared_ptr<Transport> inner_;
  const std::chrono::milliseconds interval_;
  std::mutex mutex_;
  std::chrono::steady_clock::time_point next_allowed_;
};
