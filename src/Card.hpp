#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

/// Read-only view of one card document.
class Card {
 public:
  /// Throws std::invalid_argument unless `data` has string "id" and "name".
  explicit Card(nlohmann::json data);

  const std::string& Id() const {
    return id_;
  }
  const std::string& Name() const {
    return name_;
  }
  const nlohmann::json& Data() const {
    return data_;
  }

  /// Remote URI of this card's art in `format` (e.g. "png", "normal").
  /// Throws MissingImages when the card has no image_uris map and
  /// UnsupportedFormat when the map lacks `format`. The local copy is
  /// materialized by CardCache::GetImagePath().
  std::string ImageUri(const std::string& format) const;

 private:
  std::string id_;
  std::string name_;
  nlohmann::json data_;
};

/// Card[<name> @ <id>]
std::ostream& operator<<(std::ostream& os, const Card& card);
