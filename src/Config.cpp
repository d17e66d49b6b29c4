#include "Config.hpp"
#include "Errors.hpp"
#include "FileNames.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;

Config::Config() = default;

Config::Config(const std::filesystem::path& config_file)
    : config_file_{config_file} {
  if (config_file_.empty() || !std::filesystem::exists(config_file_)) {
    throw ConfigError("cardcache config not found: " + config_file_.string());
  }

  std::ifstream in{config_file_};
  if (!in.is_open()) {
    throw ConfigError("Failed to open " + config_file_.string());
  }

  try {
    json j;
    in >> j;

    // {
    //   "application": "deckbuilder",
    //   "version": "1.2",
    //   "data_dir": "/var/lib/deckbuilder/cards",
    //   "api_base": "https://api.scryfall.com",
    //   "bulk_data_type": "default_cards",
    //   "bulk_refresh_period_s": 7257600,
    //   "response_ttl_s": 86400,
    //   "rate_limit_ms": 100,
    //   "user_agent": "deckbuilder/1.2",
    //   "ca_bundle": "/etc/ssl/certs/ca-certificates.crt",
    //   "sql_debug": false
    // }
    if (!j.is_object())
      throw ConfigError("top level must be an object");

    application_ = j.value("application", application_);
    version_ = j.value("version", version_);
    if (j.contains("data_dir"))
      data_dir_ = j.at("data_dir").get<std::string>();
    api_base_ = j.value("api_base", api_base_);
    bulk_data_type_ = j.value("bulk_data_type", bulk_data_type_);
    bulk_refresh_period_ = std::chrono::seconds{
      j.value("bulk_refresh_period_s",
              static_cast<long long>(bulk_refresh_period_.count()))};
    response_ttl_ = std::chrono::seconds{j.value(
      "response_ttl_s", static_cast<long long>(response_ttl_.count()))};
    rate_limit_ = std::chrono::milliseconds{j.value(
      "rate_limit_ms", static_cast<long long>(rate_limit_.count()))};
    user_agent_ = j.value("user_agent", user_agent_);
    if (j.contains("ca_bundle"))
      ca_bundle_ = j.at("ca_bundle").get<std::string>();
    sql_debug_ = j.value("sql_debug", sql_debug_);
  } catch (const ConfigError& ex) {
    throw ConfigError("Error parsing " + config_file_.string() + ": " +
                      ex.what());
  } catch (const json::exception& ex) {
    throw ConfigError("Error parsing " + config_file_.string() + ": " +
                      ex.what());
  }

  if (application_.empty())
    throw ConfigError("application must not be empty");
  if (bulk_refresh_period_.count() < 0 || response_ttl_.count() < 0)
    throw ConfigError("periods must not be negative");
}

std::optional<std::filesystem::path> Config::Find() {
  std::vector<std::filesystem::path> candidates;
  if (const char* h = std::getenv("HOME")) {
    candidates.push_back(std::filesystem::path{h} / ".config" / "cardcache" /
                         "conf.json");
  }
  candidates.push_back(std::filesystem::current_path() / "cardcache" /
                       "conf.json");
  candidates.push_back(std::filesystem::path{"/etc"} / "cardcache" /
                       "conf.json");

  for (auto const& file : candidates) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(file, ec)) {
      return file;
    }
  }
  return std::nullopt;
}

std::filesystem::path Config::ResolveDataDir() const {
  if (!data_dir_.empty())
    return data_dir_;

  std::filesystem::path base;
  if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
    base = xdg;
  } else if (const char* h = std::getenv("HOME"); h && *h) {
    base = std::filesystem::path{h} / ".local" / "share";
  } else {
    throw ConfigError("cannot resolve data directory: HOME is not set");
  }

  auto dir = base / "cardcache" / SanitizeForFilename(application_);
  if (!version_.empty())
    dir /= SanitizeForFilename(version_);
  return dir;
}

const std::string& Config::GetApplication() const {
  return application_;
}

const std::string& Config::GetVersion() const {
  return version_;
}

std::filesystem::path Config::GetDataDir() const {
  return ResolveDataDir();
}

const std::string& Config::GetApiBase() const {
  return api_base_;
}

const std::string& Config::GetBulkDataType() const {
  return bulk_data_type_;
}

std::chrono::seconds Config::GetBulkRefreshPeriod() const {
  return bulk_refresh_period_;
}

std::chrono::seconds Config::GetResponseTtl() const {
  return response_ttl_;
}

std::chrono::milliseconds Config::GetRateLimit() const {
  return rate_limit_;
}

const std::string& Config::GetUserAgent() const {
  return user_agent_;
}

std::filesystem::path Config::GetCaBundle() const {
  return ca_bundle_;
}

bool Config::GetSqlDebug() const {
  return sql_debug_;
}

void Config::SetApplication(std::string application) {
  application_ = std::move(application);
}

void Config::SetVersion(std::string version) {
  version_ = std::move(version);
}

void Config::SetDataDir(std::filesystem::path dir) {
  data_dir_ = std::move(dir);
}

void Config::SetApiBase(std::string api_base) {
  api_base_ = std::move(api_base);
}

void Config::SetBulkDataType(std::string type) {
  bulk_data_type_ = std::move(type);
}

void Config::SetBulkRefreshPeriod(std::chrono::seconds period) {
  bulk_refresh_period_ = period;
}

void Config::SetRateLimit(std::chrono::milliseconds interval) {
  rate_limit_ = interval;
}
