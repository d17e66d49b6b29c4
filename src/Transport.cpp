#include "Transport.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <fstream>
#include <system_error>

void DownloadToFile(Transport& transport, const URL& url,
                    const std::filesystem::path& target) {
  std::filesystem::path tmp = target;
  tmp += ".part";

  std::error_code ec;
  if (target.has_parent_path())
    std::filesystem::create_directories(target.parent_path(), ec);

  logr::debug << "[Download] " << url << " -> " << tmp;

  std::optional<HttpResponse> resp;
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw TransportError("cannot open " + tmp.string() + " for writing");
    }
    resp = transport.Stream(url, [&out](const char* data, size_t len) {
      out.write(data, static_cast<std::streamsize>(len));
      return static_cast<bool>(out);
    });
    out.flush();
    if (!out) {
      std::filesystem::remove(tmp, ec);
      throw TransportError("write failed for " + tmp.string());
    }
  }

  if (!resp.has_value() || !resp->IsOkay()) {
    std::filesystem::remove(tmp, ec);
    throw TransportError(
      "download of " + url.ToString() + " failed" +
      (resp ? " with HTTP " + std::to_string(resp->GetStatusCode()) : ""));
  }

  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw TransportError("cannot move download into " + target.string());
  }
  logr::debug << "[Download] stored " << target;
}
