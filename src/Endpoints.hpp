#pragma once

#include <cstdint>
#include <string>

#include "URL.hpp"

/// Request URLs of the card-data API, rooted at a configurable base.
class Endpoints {
 public:
  explicit Endpoints(std::string api_base);

  URL CardById(const std::string& id) const;         // /cards/<id>
  URL CardByName(const std::string& name) const;     // /cards/named?exact=
  URL CardByForeignId(std::int64_t foreign_id) const;  // /cards/mtgo/<n>
  URL BulkManifest() const;                          // /bulk-data

 private:
  URL Base() const;

  std::string api_base_;
};
