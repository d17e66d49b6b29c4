#include "BulkRefresher.hpp"
#include "Errors.hpp"
#include "FileNames.hpp"
#include "Logger.hpp"

#include <fstream>
#include <system_error>

namespace {

// Removes a scratch file when the refresh leaves scope, however it leaves.
struct ScratchFile {
  std::filesystem::path path;

  explicit ScratchFile(std::filesystem::path p) : path(std::move(p)) {
  }
  ~ScratchFile() {
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }

  ScratchFile(const ScratchFile&) = delete;
  ScratchFile& operator=(const ScratchFile&) = delete;
};

}  // namespace

BulkRefresher::BulkRefresher(CardStore& store, Transport& transport,
                             Endpoints endpoints, std::string dataset_type,
                             std::chrono::seconds period,
                             std::filesystem::path work_dir, Clock clock)
    : store_{store},
      transport_{transport},
      endpoints_{std::move(endpoints)},
      dataset_type_{std::move(dataset_type)},
      period_{period},
      work_dir_{std::move(work_dir)},
      clock_{std::move(clock)} {
}

bool BulkRefresher::IsStale() {
  const auto meta = store_.GetMetadata();
  // now > last + period, without overflowing on huge periods
  return ToEpochSeconds(clock_()) - meta.last_bulk_refresh > period_.count();
}

bool BulkRefresher::RefreshIfStale() {
  if (!IsStale())
    return false;
  logr::info << "[BulkRefresher] card data older than " << period_.count()
             << "s; refreshing";
  Refresh();
  return true;
}

std::optional<std::string> BulkRefresher::FindDatasetUri(
  const nlohmann::json& manifest, const std::string& type) {
  if (!manifest.is_object())
    return std::nullopt;
  auto data = manifest.find("data");
  if (data == manifest.end() || !data->is_array())
    return std::nullopt;

  for (const auto& entry : *data) {
    if (!entry.is_object())
      continue;
    auto t = entry.find("type");
    if (t == entry.end() || !t->is_string() || t->get<std::string>() != type)
      continue;
    for (const char* key : {"download_uri", "permalink_uri"}) {
      if (auto it = entry.find(key); it != entry.end() && it->is_string())
        return it->get<std::string>();
    }
  }
  return std::nullopt;
}

nlohmann::json BulkRefresher::FetchManifest() {
  const URL url = endpoints_.BulkManifest();
  auto response = transport_.Get(url);
  if (!response.has_value()) {
    throw TransportError("no response from " + url.ToString());
  }
  if (!response->IsOkay()) {
    auto details = response->ErrorDetails();
    throw TransportError("HTTP " + std::to_string(response->GetStatusCode()) +
                         " from " + url.ToString() +
                         (details ? ": " + *details : std::string{}));
  }
  auto manifest = response->ParseJson();
  if (!manifest.has_value()) {
    throw TransportError("malformed manifest from " + url.ToString());
  }
  return std::move(*manifest);
}

nlohmann::json BulkRefresher::FetchDataset(const std::string& uri) {
  const URL url(uri);
  if (!url.IsValid()) {
    throw TransportError("manifest names an invalid dataset URI: " + uri);
  }

  std::error_code ec;
  std::filesystem::create_directories(work_dir_, ec);
  ScratchFile scratch(work_dir_ /
                      ("bulk-" + SanitizeForFilename(dataset_type_) + ".json"));

  logr::info << "[BulkRefresher] downloading " << url;
  DownloadToFile(transport_, url, scratch.path);

  std::ifstream in(scratch.path, std::ios::binary);
  if (!in) {
    throw TransportError("cannot read " + scratch.path.string());
  }
  auto dataset = nlohmann::json::parse(in, nullptr, false);
  if (dataset.is_discarded() || !dataset.is_array()) {
    throw TransportError("dataset from " + uri + " is not a JSON array");
  }
  return dataset;
}

void BulkRefresher::Refresh() {
  auto manifest = FetchManifest();

  auto uri = FindDatasetUri(manifest, dataset_type_);
  if (!uri.has_value()) {
    throw ManifestEntryNotFound("bulk manifest has no dataset of type " +
                                dataset_type_);
  }

  auto dataset = FetchDataset(*uri);
  logr::info << "[BulkRefresher] replacing card data with " << dataset.size()
             << " document(s)";

  size_t inserted = 0;
  size_t skipped = 0;
  auto tx = store_.Begin();
  store_.ClearAllCards(*tx);
  for (const auto& doc : dataset) {
    auto record = CardRecord::FromDocument(doc);
    if (!record.has_value()) {
      ++skipped;
      continue;
    }
    if (store_.InsertCard(*tx, *record))
      ++inserted;
    else
      ++skipped;
  }
  store_.SetMetadata(*tx, ToEpochSeconds(clock_()));
  tx->Commit();

  if (skipped > 0) {
    logr::warning << "[BulkRefresher] skipped " << skipped
                  << " document(s) without a usable id/name or with a "
                     "duplicate id";
  }
  logr::info << "[BulkRefresher] stored " << inserted << " card(s)";
}
