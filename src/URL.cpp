#include "URL.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace {

inline bool is_unreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

inline int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

}  // namespace

URL::URL(const std::string& url_string) : raw_url_(url_string) {
  Parse();
}

void URL::Parse() {
  // 1: "scheme://" (optional), 2: scheme, 3: host[:port], 4: path,
  // 5: query with '?', 6: fragment with '#'
  static const std::regex url_regex(
    R"(^(([a-zA-Z][a-zA-Z0-9+.-]*)://)?([^/?#]+)(/[^?#]*)?(\?[^#]*)?(#.*)?$)");
  std::smatch match;
  if (std::regex_match(raw_url_, match, url_regex)) {
    scheme_ = match[2].matched ? match[2].str() : "";
    host_ = match[3];
    path_ = match[4].matched ? match[4].str() : "";
    query_ = match[5].matched ? match[5].str() : "";
    fragment_ = match[6].matched ? match[6].str().substr(1) : "";
  } else {
    scheme_.clear();
    host_.clear();
    path_.clear();
    query_.clear();
    fragment_.clear();
    logr::warning << "[URL] invalid: " << raw_url_;
  }
}

bool URL::IsValid() const {
  return !scheme_.empty() && !host_.empty();
}

void URL::ParseQueryParams() const {
  if (query_params_.has_value())
    return;

  query_params_.emplace();

  if (query_.empty() || query_[0] != '?')
    return;

  size_t start = 1;
  while (start < query_.size()) {
    size_t amp = query_.find('&', start);
    if (amp == std::string::npos)
      amp = query_.size();
    std::string_view pair(query_.data() + start, amp - start);
    start = amp + 1;

    auto eq = pair.find('=');
    std::string key = Decode(pair.substr(0, eq));
    if (key.empty())
      continue;
    std::optional<std::string> value;
    if (eq != std::string_view::npos)
      value = Decode(pair.substr(eq + 1));
    query_params_->emplace_back(std::move(key), std::move(value));
  }
}

std::string URL::GetScheme() const {
  return scheme_;
}

std::string URL::GetHost() const {
  return host_;
}

std::string URL::GetPath() const {
  return path_;
}

std::string URL::GetQuery() const {
  if (!query_params_.has_value()) {
    return query_;
  }

  std::string result;
  for (const auto& [key, value] : *query_params_) {
    result += result.empty() ? '?' : '&';
    result += Encode(key);
    if (value.has_value()) {
      result += '=';
      result += Encode(*value);
    }
  }
  return result;
}

std::optional<std::vector<std::optional<std::string>>> URL::GetQueryParam(
  const std::string& key) const {
  ParseQueryParams();
  std::vector<std::optional<std::string>> values;
  for (const auto& [param, value] : *query_params_) {
    if (param == key)
      values.push_back(value);
  }
  if (values.empty())
    return std::nullopt;
  return values;
}

void URL::AppendPath(const std::string& segment) {
  if (path_.empty() || path_.back() != '/')
    path_ += '/';
  path_ += Encode(segment);
}

void URL::SetQueryParam(const std::string& key,
                        std::optional<std::string> value) {
  ParseQueryParams();
  auto& vec = *query_params_;
  auto it = std::find_if(vec.begin(), vec.end(),
                         [&](auto& kv) { return kv.first == key; });
  if (it != vec.end()) {
    it->second = std::move(value);
  } else {
    vec.emplace_back(key, std::move(value));
  }
}

std::string URL::ToString() const {
  std::string url;

  if (!scheme_.empty()) {
    url += scheme_;
    url += "://";
  }

  url += host_;

  if (!path_.empty()) {
    if (path_[0] != '/') {
      url += '/';
    }
    url += path_;
  }

  url += GetQuery();

  if (!fragment_.empty()) {
    url += '#';
    url += fragment_;
  }

  return url;
}

std::string URL::Encode(std::string_view raw) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(raw.size());
  for (unsigned char c : raw) {
    if (is_unreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string URL::Decode(std::string_view encoded) {
  std::string out;
  out.reserve(encoded.size());
  for (size_t i = 0; i < encoded.size(); ++i) {
    char c = encoded[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < encoded.size() &&
               hex_value(encoded[i + 1]) >= 0 &&
               hex_value(encoded[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hex_value(encoded[i + 1]) * 16 +
                                      hex_value(encoded[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}
