#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

class Config {
 public:
  static constexpr std::chrono::seconds kOneDay{24 * 60 * 60};
  static constexpr std::chrono::seconds kTwelveWeeks{12 * 7 * 24 * 60 * 60};
  // The upstream API asks for no more than 10 requests per second.
  static constexpr std::chrono::milliseconds kDefaultRateLimit{100};

  /// All defaults.
  Config();

  /// Defaults overlaid with the keys present in a JSON file.
  /// Throws ConfigError when the file is missing or malformed.
  explicit Config(const std::filesystem::path& conf_file);

  Config(const Config& conf) = default;

  /// First conf.json among the standard locations, if any.
  static std::optional<std::filesystem::path> Find();

  const std::string& GetApplication() const;
  const std::string& GetVersion() const;

  /// Where the store and downloaded art live; see ResolveDataDir().
  std::filesystem::path GetDataDir() const;

  const std::string& GetApiBase() const;
  const std::string& GetBulkDataType() const;
  std::chrono::seconds GetBulkRefreshPeriod() const;
  std::chrono::seconds GetResponseTtl() const;
  std::chrono::milliseconds GetRateLimit() const;
  const std::string& GetUserAgent() const;
  std::filesystem::path GetCaBundle() const;
  bool GetSqlDebug() const;

  void SetApplication(std::string application);
  void SetVersion(std::string version);
  void SetDataDir(std::filesystem::path dir);
  void SetApiBase(std::string api_base);
  void SetBulkDataType(std::string type);
  void SetBulkRefreshPeriod(std::chrono::seconds period);
  void SetRateLimit(std::chrono::milliseconds interval);

 private:
  std::filesystem::path ResolveDataDir() const;

  std::filesystem::path config_file_;
  std::string application_{"default"};
  std::string version_;
  std::filesystem::path data_dir_;
  std::string api_base_{"https://api.scryfall.com"};
  std::string bulk_data_type_{"default_cards"};
  std::chrono::seconds bulk_refresh_period_{kTwelveWeeks};
  std::chrono::seconds response_ttl_{kOneDay};
  std::chrono::milliseconds rate_limit_{kDefaultRateLimit};
  std::string user_agent_{"cardcache/0.3"};
  std::filesystem::path ca_bundle_;
  bool sql_debug_{false};
};
