#pragma once

#include <atomic>
#include <cstdio>  // for fileno()
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>  // for isatty()

namespace logr {

enum class Level { Debug = 0, Info, Warning, Error, None };

inline std::optional<Level> ParseLevel(std::string_view s) {
  if (s == "debug")
    return Level::Debug;
  if (s == "info")
    return Level::Info;
  if (s == "warning")
    return Level::Warning;
  if (s == "error")
    return Level::Error;
  if (s == "none")
    return Level::None;
  return std::nullopt;
}

// Environment wins over ~/.cardcache/logging.json; both fall back to Info.
inline Level ConfiguredLevel() {
  Level base = Level::Info;
  if (auto* home = std::getenv("HOME")) {
    std::ifstream in{std::string(home) + "/.cardcache/logging.json"};
    if (in) {
      auto j = nlohmann::json::parse(in, nullptr, false);
      if (!j.is_discarded() && j.is_object()) {
        if (auto it = j.find("level"); it != j.end() && it->is_string()) {
          if (auto lvl = ParseLevel(it->get<std::string>()))
            base = *lvl;
        }
      }
    }
  }
  if (auto* env = std::getenv("CARDCACHE_LOG")) {
    if (auto lvl = ParseLevel(env))
      base = *lvl;
  }
  return base;
}

inline std::atomic<Level>& LevelSlot() {
  static std::atomic<Level> lvl{ConfiguredLevel()};
  return lvl;
}

inline Level CurrentLevel() {
  return LevelSlot().load(std::memory_order_relaxed);
}

// Runtime override, e.g. from a --verbose flag.
inline void SetLevel(Level lvl) {
  LevelSlot().store(lvl, std::memory_order_relaxed);
}

inline bool ShouldMute(Level msg) {
  return msg == Level::None || msg < CurrentLevel();
}

inline bool is_tty() {
  return ::isatty(::fileno(stderr)) != 0;
}

// ANSI escape sequences
static constexpr char const* RESET = "\033[0m";
static constexpr char const* CYAN = "\033[36m";
static constexpr char const* GREEN = "\033[32m";
static constexpr char const* YELLOW = "\033[33m";
static constexpr char const* RED = "\033[31m";

inline constexpr char const* colorCode(Level L) {
  switch (L) {
    case Level::Debug:
      return CYAN;
    case Level::Info:
      return GREEN;
    case Level::Warning:
      return YELLOW;
    case Level::Error:
      return RED;
    default:
      return RESET;
  }
}

inline constexpr char const* label(Level L) {
  switch (L) {
    case Level::Debug:
      return "D ";
    case Level::Info:
      return "I ";
    case Level::Warning:
      return "W ";
    case Level::Error:
      return "E ";
    default:
      return "";
  }
}

// One line of output: prefix in ctor, newline in dtor, mutex held in between.
class LogEntry {
 public:
  explicit LogEntry(Level L)
      : lvl(L), muted(ShouldMute(L)), lock(log_mutex(), std::defer_lock) {
    if (!muted) {
      lock.lock();
      if (is_tty()) {
        std::cerr << colorCode(lvl);
      }
      std::cerr << label(lvl);
    }
  }

  ~LogEntry() {
    if (!muted && lock.owns_lock()) {
      if (is_tty()) {
        std::cerr << RESET;
      }
      std::cerr << std::endl;
    }
  }

  LogEntry(LogEntry&&) noexcept = default;
  LogEntry& operator=(LogEntry&&) noexcept = default;

  LogEntry(const LogEntry&) = delete;
  LogEntry& operator=(const LogEntry&) = delete;

  template <typename T>
  LogEntry& operator<<(T const& v) {
    if (!muted) {
      std::cerr << v;
    }
    return *this;
  }

  LogEntry& operator<<(std::ostream& (*m)(std::ostream&)) {
    if (!muted) {
      m(std::cerr);
    }
    return *this;
  }

 private:
  Level lvl;
  bool muted;
  std::unique_lock<std::mutex> lock;

  static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
  }
};

struct Logger {
  Level lvl;
  constexpr Logger(Level L) : lvl(L) {
  }

  template <typename T>
  LogEntry operator<<(T const& v) const {
    LogEntry e(lvl);
    e << v;
    return e;
  }
};

inline constexpr Logger debug{Level::Debug};
inline constexpr Logger info{Level::Info};
inline constexpr Logger warning{Level::Warning};
inline constexpr Logger error{Level::Error};
}  // namespace logr
