#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "Transport.hpp"

/// Transport over a fresh libcurl easy handle per request.
class CurlTransport : public Transport {
 public:
  explicit CurlTransport(std::string user_agent,
                         std::filesystem::path ca_bundle = {});
  CurlTransport(const CurlTransport&) = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  std::optional<HttpResponse> Get(const URL& url) override;
  std::optional<HttpResponse> Stream(const URL& url,
                                     const BodySink& sink) override;

 private:
  struct Request {
    HttpResponse response;
    const BodySink* sink{nullptr};
  };

  std::optional<HttpResponse> Perform(const URL& url, const BodySink* sink);

  static size_t WriteBodyCallback(char* ptr, size_t size, size_t nmemb,
                                  void* userdata);
  static size_t WriteHeaderCallback(char* ptr, size_t size, size_t nmemb,
                                    void* userdata);

  std::string user_agent_;
  std::filesystem::path ca_bundle_;
};
