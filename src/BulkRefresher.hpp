#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "CardStore.hpp"
#include "Endpoints.hpp"
#include "Records.hpp"
#include "Transport.hpp"

/*
  Whole-corpus resynchronization.

  The manifest names a dataset URI per dataset type; the dataset is a JSON
  array of card documents. It is streamed to a scratch file under work_dir,
  parsed, and swapped in with one transaction covering clear, insert and the
  metadata timestamp, so readers see either the old or the new corpus.
  Nothing here goes through the response cache, and every failure throws.
*/
class BulkRefresher {
 public:
  BulkRefresher(CardStore& store, Transport& transport, Endpoints endpoints,
                std::string dataset_type, std::chrono::seconds period,
                std::filesystem::path work_dir, Clock clock);
  BulkRefresher(const BulkRefresher&) = delete;

  /// now > last_bulk_refresh + period
  bool IsStale();

  /// Refresh() when IsStale(); returns whether it ran.
  bool RefreshIfStale();

  /// Throws TransportError, ManifestEntryNotFound or StoreError.
  void Refresh();

  /// download_uri (or, failing that, permalink_uri) of the manifest entry
  /// whose "type" equals `type`.
  static std::optional<std::string> FindDatasetUri(
    const nlohmann::json& manifest, const std::string& type);

 private:
  nlohmann::json FetchManifest();
  nlohmann::json FetchDataset(const std::string& uri);

  CardStore& store_;
  Transport& transport_;
  Endpoints endpoints_;
  std::string dataset_type_;
  std::chrono::seconds period_;
  std::filesystem::path work_dir_;
  Clock clock_;
};
