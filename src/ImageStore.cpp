#include "ImageStore.hpp"
#include "Errors.hpp"
#include "FileNames.hpp"
#include "Logger.hpp"

#include <system_error>

ImageStore::ImageStore(Transport& transport, std::filesystem::path root)
    : transport_{transport}, root_{std::move(root)} {
}

std::string ImageStore::Extension(const std::string& format) {
  return format == "png" ? "png" : "jpg";
}

std::filesystem::path ImageStore::LocalPath(const std::string& card_id,
                                            const std::string& format) const {
  return root_ / SanitizeForFilename(format) /
         (SanitizeForFilename(card_id) + "." + Extension(format));
}

std::optional<std::filesystem::path> ImageStore::GetImagePath(
  const Card& card, const std::string& format) {
  const std::string uri = card.ImageUri(format);

  auto path = LocalPath(card.Id(), format);
  logr::debug << "[ImageStore] " << card << " " << format << " -> " << path;

  std::error_code ec;
  if (std::filesystem::exists(path, ec))
    return path;

  try {
    DownloadToFile(transport_, URL(uri), path);
  } catch (const TransportError& ex) {
    logr::warning << "[ImageStore] " << ex.what();
    return std::nullopt;
  }
  return path;
}
