#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "CardCache.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

namespace {

enum Exit { kFound = 0, kNotFound = 1, kUsage = 2, kFailure = 3 };

void Usage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " [--config FILE] [--app NAME] [--verbose] <command>\n"
               "commands:\n"
               "  id <id>               card by upstream id\n"
               "  name <name>           card by exact name\n"
               "  mtgo <n>              card by MTGO id\n"
               "  image <id> <format>   local path of card art\n"
               "  refresh               force a bulk refresh\n"
               "  dir                   print the cache directory\n";
}

int PrintCard(const std::optional<Card>& card) {
  if (!card) {
    logr::info << "not found";
    return kNotFound;
  }
  std::cout << card->Data().dump(2) << std::endl;
  return kFound;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::optional<std::string> config_file;
  std::optional<std::string> application;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "--config" || a == "--app") && i + 1 < argc) {
      (a == "--config" ? config_file : application) = argv[++i];
    } else if (a == "--verbose" || a == "-v") {
      logr::SetLevel(logr::Level::Debug);
    } else if (a == "--help" || a == "-h") {
      Usage(argv[0]);
      return kFound;
    } else {
      args.push_back(std::move(a));
    }
  }

  if (args.empty()) {
    Usage(argv[0]);
    return kUsage;
  }
  const std::string& cmd = args[0];
  const size_t want = cmd == "image"                     ? 3
                      : (cmd == "refresh" || cmd == "dir") ? 1
                                                           : 2;
  if (args.size() != want) {
    Usage(argv[0]);
    return kUsage;
  }

  std::optional<Config> conf;
  try {
    if (config_file) {
      conf.emplace(std::filesystem::path{*config_file});
    } else if (auto found = Config::Find()) {
      logr::debug << "config: " << *found;
      conf.emplace(*found);
    } else {
      conf.emplace();
    }
  } catch (const ConfigError& e) {
    logr::error << e.what();
    return kUsage;
  }
  if (application)
    conf->SetApplication(*application);

  try {
    if (cmd == "dir") {
      std::cout << conf->GetDataDir().string() << std::endl;
      return kFound;
    }

    CardCache cache(*conf);

    if (cmd == "id")
      return PrintCard(cache.GetById(args[1]));
    if (cmd == "name")
      return PrintCard(cache.GetByName(args[1]));
    if (cmd == "mtgo") {
      std::int64_t n = 0;
      try {
        n = std::stoll(args[1]);
      } catch (const std::exception&) {
        logr::error << "not an MTGO id: " << args[1];
        return kUsage;
      }
      return PrintCard(cache.GetByForeignId(n));
    }
    if (cmd == "image") {
      auto card = cache.GetById(args[1]);
      if (!card) {
        logr::info << "not found";
        return kNotFound;
      }
      auto path = cache.GetImagePath(*card, args[2]);
      if (!path)
        return kFailure;
      std::cout << path->string() << std::endl;
      return kFound;
    }
    if (cmd == "refresh") {
      cache.Refresh();
      logr::info << cache.Store().CountCards() << " card(s) stored";
      return kFound;
    }
  } catch (const MissingImages& e) {
    logr::error << e.what();
    return kNotFound;
  } catch (const UnsupportedFormat& e) {
    logr::error << e.what();
    return kNotFound;
  } catch (const std::exception& e) {
    logr::error << "cardcache failed: " << e.what();
    return kFailure;
  }

  Usage(argv[0]);
  return kUsage;
}
