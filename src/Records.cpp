#include "Records.hpp"

std::optional<CardRecord> CardRecord::FromDocument(const nlohmann::json& doc) {
  if (!doc.is_object())
    return std::nullopt;

  auto id = doc.find("id");
  auto name = doc.find("name");
  if (id == doc.end() || !id->is_string() || name == doc.end() ||
      !name->is_string())
    return std::nullopt;

  CardRecord r;
  r.id = id->get<std::string>();
  r.name = name->get<std::string>();
  if (r.id.empty())
    return std::nullopt;

  if (auto fid = doc.find("mtgo_id");
      fid != doc.end() && fid->is_number_integer()) {
    r.foreign_id = fid->get<std::int64_t>();
  }
  r.payload = doc;
  return r;
}
