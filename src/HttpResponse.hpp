#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class HttpResponse {
 public:
  HttpResponse() = default;
  HttpResponse(long status, std::string body)
      : body_{std::move(body)}, status_code_{status} {
  }

  /// Parse one raw header line (e.g. "Content-Type: application/json")
  void AddHeaderLine(const std::string& line);

  /// Append to the response body
  void AppendBody(const char* data, size_t len);

  /// Return the first header value matching `key` (case-insensitive)
  std::optional<std::string> GetHeader(const std::string& key) const;

  const std::string& GetBody() const;

  void SetStatusCode(long http_status);
  long GetStatusCode() const;

  /// The URL the response finally came from, after redirects
  void SetEffectiveUrl(const std::string& url);
  const std::string& GetEffectiveUrl() const;

  /// HTTP status code is 200 to 299
  bool IsOkay() const;

  /// Body parsed as JSON; nullopt when it is not a JSON document.
  std::optional<nlohmann::json> ParseJson() const;

  /// "details" of an API error object ({"object":"error",...}) in the body.
  std::optional<std::string> ErrorDetails() const;

 private:
  std::vector<std::pair<std::string, std::string>> headers_;
  std::string body_;
  long status_code_{0};
  std::string effective_url_;
};
