#include "HttpResponse.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

void trim(std::string& s) {
  auto l = s.find_first_not_of(" \t\r\n");
  auto r = s.find_last_not_of(" \t\r\n");
  if (l == std::string::npos) {
    s.clear();
    return;
  }
  s = s.substr(l, r - l + 1);
}

}  // namespace

void HttpResponse::AddHeaderLine(const std::string& line) {
  // A status line starts a new header block (redirects, 100-continue).
  if (line.rfind("HTTP/", 0) == 0) {
    headers_.clear();
    return;
  }

  auto colon = line.find(':');
  if (colon == std::string::npos)
    return;

  std::string name = line.substr(0, colon);
  std::string value = line.substr(colon + 1);
  trim(name);
  trim(value);

  headers_.emplace_back(std::move(name), std::move(value));
}

void HttpResponse::AppendBody(const char* data, size_t len) {
  body_.append(data, len);
}

std::optional<std::string> HttpResponse::GetHeader(
  const std::string& key) const {
  std::string want = lowercase(key);
  for (auto const& [name, val] : headers_) {
    if (lowercase(name) == want) {
      return val;
    }
  }
  return std::nullopt;
}

const std::string& HttpResponse::GetBody() const {
  return body_;
}

void HttpResponse::SetStatusCode(long http_status) {
  status_code_ = http_status;
}

long HttpResponse::GetStatusCode() const {
  return status_code_;
}

void HttpResponse::SetEffectiveUrl(const std::string& url) {
  effective_url_ = url;
}

const std::string& HttpResponse::GetEffectiveUrl() const {
  return effective_url_;
}

bool HttpResponse::IsOkay() const {
  return status_code_ >= 200 && status_code_ < 300;
}

std::optional<nlohmann::json> HttpResponse::ParseJson() const {
  auto j = nlohmann::json::parse(body_, nullptr, false);
  if (j.is_discarded())
    return std::nullopt;
  return j;
}

std::optional<std::string> HttpResponse::ErrorDetails() const {
  auto j = ParseJson();
  if (!j || !j->is_object())
    return std::nullopt;
  auto kind = j->find("object");
  if (kind == j->end() || !kind->is_string() || *kind != "error")
    return std::nullopt;
  auto it = j->find("details");
  if (it == j->end() || !it->is_string())
    return std::nullopt;
  return it->get<std::string>();
}
