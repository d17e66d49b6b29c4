#pragma once

#include <stdexcept>
#include <string>

// Base of everything the cache throws.
class CardCacheError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Resolve() called without exactly one key.
class InvalidQuery : public CardCacheError {
 public:
  using CardCacheError::CardCacheError;
};

// The bulk manifest has no entry of the configured dataset type.
class ManifestEntryNotFound : public CardCacheError {
 public:
  using CardCacheError::CardCacheError;
};

// A hard transport failure (bulk refresh, downloads).
class TransportError : public CardCacheError {
 public:
  using CardCacheError::CardCacheError;
};

class StoreError : public CardCacheError {
 public:
  using CardCacheError::CardCacheError;
};

class ConfigError : public CardCacheError {
 public:
  using CardCacheError::CardCacheError;
};

// The card document has no image_uris map.
class MissingImages : public CardCacheError {
 public:
  using CardCacheError::CardCacheError;
};

// image_uris has no entry for the requested format.
class UnsupportedFormat : public CardCacheError {
 public:
  using CardCacheError::CardCacheError;
};
