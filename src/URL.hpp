#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class URL {
 public:
  explicit URL(const std::string& url_string);

  bool IsValid() const;
  std::string GetScheme() const;
  std::string GetHost() const;
  std::string GetPath() const;

  /// Query string including the leading '?', or empty.
  std::string GetQuery() const;

  /// All (decoded) values recorded for `key`, or nullopt when absent.
  std::optional<std::vector<std::optional<std::string>>> GetQueryParam(
    const std::string& key) const;

  void AppendPath(const std::string& segment);
  void SetQueryParam(const std::string& key,
                     std::optional<std::string> value = std::nullopt);

  std::string ToString() const;

  /// Percent-encode everything outside the RFC 3986 unreserved set.
  static std::string Encode(std::string_view raw);
  static std::string Decode(std::string_view encoded);

 private:
  using QueryParams =
    std::vector<std::pair<std::string, std::optional<std::string>>>;

  std::string raw_url_;
  std::string scheme_, host_, path_, query_, fragment_;
  mutable std::optional<QueryParams> query_params_;

  void Parse();
  void ParseQueryParams() const;
};

inline std::ostream& operator<<(std::ostream& os, const URL& u) {
  os << u.ToString();
  return os;
}

