#include "Endpoints.hpp"

Endpoints::Endpoints(std::string api_base) : api_base_{std::move(api_base)} {
  while (!api_base_.empty() && api_base_.back() == '/')
    api_base_.pop_back();
}

URL Endpoints::Base() const {
  return URL(api_base_);
}

URL Endpoints::CardById(const std::string& id) const {
  URL url = Base();
  url.AppendPath("cards");
  url.AppendPath(id);
  return url;
}

URL Endpoints::CardByName(const std::string& name) const {
  URL url = Base();
  url.AppendPath("cards");
  url.AppendPath("named");
  url.SetQueryParam("exact", name);
  return url;
}

URL Endpoints::CardByForeignId(std::int64_t foreign_id) const {
  URL url = Base();
  url.AppendPath("cards");
  url.AppendPath("mtgo");
  url.AppendPath(std::to_string(foreign_id));
  return url;
}

URL Endpoints::BulkManifest() const {
  URL url = Base();
  url.AppendPath("bulk-data");
  return url;
}
