#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "Card.hpp"
#include "Transport.hpp"

/// Card art downloaded once into <root>/<format>/<id>.<png|jpg>.
class ImageStore {
 public:
  ImageStore(Transport& transport, std::filesystem::path root);
  ImageStore(const ImageStore&) = delete;

  /// "png" for the png format, "jpg" for every other one.
  static std::string Extension(const std::string& format);

  std::filesystem::path LocalPath(const std::string& card_id,
                                  const std::string& format) const;

  /// Local path of the art, downloading it when not yet present.
  /// Throws MissingImages when the card has no image_uris map and
  /// UnsupportedFormat when the map lacks `format`. A failed download is
  /// logged and yields nullopt.
  std::optional<std::filesystem::path> GetImagePath(const Card& card,
                                                    const std::string& format);

 private:
  Transport& transport_;
  std::filesystem::path root_;
};
