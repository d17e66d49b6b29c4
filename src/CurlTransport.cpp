#include "CurlTransport.hpp"
#include "Logger.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace {

void GlobalInitOnce() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct EasyDeleter {
  void operator()(CURL* c) const {
    curl_easy_cleanup(c);
  }
};

}  // namespace

CurlTransport::CurlTransport(std::string user_agent,
                             std::filesystem::path ca_bundle)
    : user_agent_{std::move(user_agent)}, ca_bundle_{std::move(ca_bundle)} {
  GlobalInitOnce();
}

std::optional<HttpResponse> CurlTransport::Get(const URL& url) {
  return Perform(url, nullptr);
}

std::optional<HttpResponse> CurlTransport::Stream(const URL& url,
                                                  const BodySink& sink) {
  return Perform(url, &sink);
}

std::optional<HttpResponse> CurlTransport::Perform(const URL& url,
                                                   const BodySink* sink) {
  std::unique_ptr<CURL, EasyDeleter> handle{curl_easy_init()};
  CURL* curl = handle.get();

  if (!curl) {
    logr::error << "[CurlTransport] failed to init CURL";
    return std::nullopt;
  }

  const std::string target = url.ToString();

  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // thread-safe timeouts on *nix
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 10000L);
  // No total timeout: bulk datasets are large. Stalled transfers still abort.
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
  curl_easy_setopt(curl, CURLOPT_URL, target.c_str());

  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

  curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

  curl_easy_setopt(curl, CURLOPT_VERBOSE, 0L);

  if (!ca_bundle_.empty()) {
    curl_easy_setopt(curl, CURLOPT_CAINFO, ca_bundle_.c_str());
  }
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  Request req;
  req.sink = sink;

  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteBodyCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &req);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, WriteHeaderCallback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &req);

  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

  logr::debug << "[CurlTransport] GET " << target;
  CURLcode code = curl_easy_perform(curl);

  // A retry can only be transparent while nothing reached the sink.
  if ((code == CURLE_HTTP2_STREAM || code == CURLE_HTTP2) &&
      req.response.GetBody().empty() && sink == nullptr) {
    logr::warning << "[CurlTransport] HTTP 2.0 error; retry HTTP 1.1 for: "
                  << url.GetHost();
    req = Request{};
    errbuf[0] = '\0';
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    code = curl_easy_perform(curl);
  }

  if (code != CURLE_OK) {
    logr::warning << "[CurlTransport] URL error: " << target;
    logr::warning << "[CurlTransport] CURL error: " << curl_easy_strerror(code);
    if (errbuf[0])
      logr::warning << "[CurlTransport] detail: " << errbuf;
    return std::nullopt;
  }

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  req.response.SetStatusCode(http_code);

  char* effective_url = nullptr;
  curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
  if (effective_url)
    req.response.SetEffectiveUrl(effective_url);

  logr::debug << "[CurlTransport] HTTP " << http_code << " for " << target;
  return std::move(req.response);
}

size_t CurlTransport::WriteBodyCallback(char* ptr, size_t size, size_t nmemb,
                                        void* userdata) {
  auto* req = static_cast<Request*>(userdata);
  const size_t len = size * nmemb;
  if (req->sink) {
    // Returning a short count makes libcurl abort with CURLE_WRITE_ERROR.
    return (*req->sink)(ptr, len) ? len : 0;
  }
  req->response.AppendBody(ptr, len);
  return len;
}

size_t CurlTransport::WriteHeaderCallback(char* ptr, size_t size, size_t nmemb,
                                          void* userdata) {
  auto* req = static_cast<Request*>(userdata);
  std::string line(ptr, size * nmemb);
  req->response.AddHeaderLine(line);
  return size * nmemb;
}
