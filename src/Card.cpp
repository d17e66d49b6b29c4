#include "Card.hpp"
#include "Errors.hpp"

#include <stdexcept>

Card::Card(nlohmann::json data) : data_(std::move(data)) {
  auto id = data_.find("id");
  auto name = data_.find("name");
  if (!data_.is_object() || id == data_.end() || !id->is_string() ||
      name == data_.end() || !name->is_string()) {
    throw std::invalid_argument("card document needs string id and name");
  }
  id_ = id->get<std::string>();
  name_ = name->get<std::string>();
}

std::string Card::ImageUri(const std::string& format) const {
  auto uris = data_.find("image_uris");
  if (uris == data_.end() || !uris->is_object())
    throw MissingImages("no images for card " + id_);

  auto uri = uris->find(format);
  if (uri == uris->end() || !uri->is_string()) {
    throw UnsupportedFormat("art format " + format + " not available for " +
                            id_);
  }
  return uri->get<std::string>();
}

std::ostream& operator<<(std::ostream& os, const Card& card) {
  return os << "Card[" << card.Name() << " @ " << card.Id() << "]";
}
