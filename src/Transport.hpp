#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>

#include "HttpResponse.hpp"
#include "URL.hpp"

/// Receives a chunk of a streamed body; return false to abort the transfer.
using BodySink = std::function<bool(const char* data, size_t len)>;

/// Blocking HTTP GET. Implementations return nullopt when no response was
/// received at all (DNS, connect, TLS, timeout); any HTTP status, including
/// errors, comes back as a response.
class Transport {
 public:
  virtual ~Transport() = default;

  virtual std::optional<HttpResponse> Get(const URL& url) = 0;

  /// Like Get(), but the body goes to `sink` instead of the response.
  virtual std::optional<HttpResponse> Stream(const URL& url,
                                             const BodySink& sink) = 0;
};

/// Streams `url` into `<target>.part` and renames it onto `target`.
/// Throws TransportError on any failure; the partial file is removed.
void DownloadToFile(Transport& transport, const URL& url,
                    const std::filesystem::path& target);
