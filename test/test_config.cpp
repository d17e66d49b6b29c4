#include "Config.hpp"
#include "Errors.hpp"
#include "FileNames.hpp"
#include "TestSupport.hpp"

#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>

using namespace testing_support;

namespace {

// Sets an environment variable for one scope, restoring the old value.
class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_{name} {
    if (const char* old = std::getenv(name))
      old_ = old;
    if (value)
      setenv(name, value, 1);
    else
      unsetenv(name);
  }
  ~ScopedEnv() {
    if (old_)
      setenv(name_, old_->c_str(), 1);
    else
      unsetenv(name_);
  }

 private:
  const char* name_;
  std::optional<std::string> old_;
};

void WriteFile(const fs::path& p, const std::string& text) {
  std::ofstream out(p);
  out << text;
}

}  // namespace

TEST(ConfigTest, Defaults) {
  SCOPED_TRACE("A default Config talks to the public API politely.");
  RecordProperty("description",
                 "Application 'default', default_cards, a twelve-week bulk "
                 "period, one-day TTL and 100 ms pacing.");

  Config c;
  EXPECT_EQ(c.GetApplication(), "default");
  EXPECT_EQ(c.GetApiBase(), "https://api.scryfall.com");
  EXPECT_EQ(c.GetBulkDataType(), "default_cards");
  EXPECT_EQ(c.GetBulkRefreshPeriod(), Config::kTwelveWeeks);
  EXPECT_EQ(c.GetResponseTtl(), Config::kOneDay);
  EXPECT_EQ(c.GetRateLimit(), std::chrono::milliseconds(100));
  EXPECT_FALSE(c.GetSqlDebug());
  EXPECT_TRUE(c.GetCaBundle().empty());
}

TEST(ConfigTest, LoadsJsonOverlay) {
  SCOPED_TRACE("Keys in the file override defaults; others are kept.");
  RecordProperty("description",
                 "application, version, data_dir, response_ttl_s and "
                 "rate_limit_ms come from the file.");

  TempDir dir;
  const auto file = dir.Path() / "conf.json";
  WriteFile(file, R"({
    "application": "deckbuilder",
    "version": "1.2",
    "data_dir": "/srv/cards",
    "response_ttl_s": 60,
    "rate_limit_ms": 250,
    "sql_debug": true
  })");

  Config c(file);
  EXPECT_EQ(c.GetApplication(), "deckbuilder");
  EXPECT_EQ(c.GetVersion(), "1.2");
  EXPECT_EQ(c.GetDataDir(), fs::path("/srv/cards"));
  EXPECT_EQ(c.GetResponseTtl(), std::chrono::seconds(60));
  EXPECT_EQ(c.GetRateLimit(), std::chrono::milliseconds(250));
  EXPECT_TRUE(c.GetSqlDebug());
  EXPECT_EQ(c.GetBulkDataType(), "default_cards");
}

TEST(ConfigTest, BadFilesAreConfigErrors) {
  SCOPED_TRACE("Missing, malformed and mistyped files are rejected.");
  RecordProperty("description",
                 "Each case throws ConfigError.");

  TempDir dir;
  EXPECT_THROW(Config(dir.Path() / "absent.json"), ConfigError);

  const auto broken = dir.Path() / "broken.json";
  WriteFile(broken, "{ \"application\": ");
  EXPECT_THROW(Config{broken}, ConfigError);

  const auto array = dir.Path() / "array.json";
  WriteFile(array, "[1, 2]");
  EXPECT_THROW(Config{array}, ConfigError);

  const auto typed = dir.Path() / "typed.json";
  WriteFile(typed, R"({"rate_limit_ms": "fast"})");
  EXPECT_THROW(Config{typed}, ConfigError);

  const auto empty_app = dir.Path() / "empty_app.json";
  WriteFile(empty_app, R"({"application": ""})");
  EXPECT_THROW(Config{empty_app}, ConfigError);
}

TEST(ConfigTest, DataDirFollowsXdg) {
  SCOPED_TRACE("Without data_dir the directory is derived per application.");
  RecordProperty("description",
                 "XDG_DATA_HOME/cardcache/<application>[/<version>], falling "
                 "back to ~/.local/share.");

  {
    ScopedEnv xdg("XDG_DATA_HOME", "/tmp/xdg");
    Config c;
    c.SetApplication("deck");
    EXPECT_EQ(c.GetDataDir(), fs::path("/tmp/xdg/cardcache/deck"));
    c.SetVersion("2");
    EXPECT_EQ(c.GetDataDir(), fs::path("/tmp/xdg/cardcache/deck/2"));
  }
  {
    ScopedEnv xdg("XDG_DATA_HOME", nullptr);
    ScopedEnv home("HOME", "/home/tester");
    Config c;
    EXPECT_EQ(c.GetDataDir(),
              fs::path("/home/tester/.local/share/cardcache/default"));
  }
  {
    ScopedEnv xdg("XDG_DATA_HOME", nullptr);
    ScopedEnv home("HOME", nullptr);
    Config c;
    EXPECT_THROW(c.GetDataDir(), ConfigError);
    c.SetDataDir("/explicit");
    EXPECT_EQ(c.GetDataDir(), fs::path("/explicit"));
  }
}

TEST(ConfigTest, DataDirComponentsCannotEscape) {
  SCOPED_TRACE("application and version become single path components.");
  RecordProperty("description",
                 "Slashes and '..' in application or version cannot move the "
                 "data directory outside XDG_DATA_HOME/cardcache.");

  ScopedEnv xdg("XDG_DATA_HOME", "/tmp/xdg");
  Config c;
  c.SetApplication("../outside");
  EXPECT_EQ(c.GetDataDir(), fs::path("/tmp/xdg/cardcache/.._outside"));

  c.SetApplication("..");
  c.SetVersion("a/b");
  EXPECT_EQ(c.GetDataDir(), fs::path("/tmp/xdg/cardcache/_../a_b"));
}

TEST(FileNamesTest, SanitizeForFilename) {
  SCOPED_TRACE("One safe path component from arbitrary text.");
  RecordProperty("description",
                 "Unsafe characters become '_' and '', '.', '..' are "
                 "prefixed.");

  EXPECT_EQ(SanitizeForFilename("default_cards"), "default_cards");
  EXPECT_EQ(SanitizeForFilename("a/b c"), "a_b_c");
  EXPECT_EQ(SanitizeForFilename(""), "_");
  EXPECT_EQ(SanitizeForFilename("."), "_.");
  EXPECT_EQ(SanitizeForFilename(".."), "_..");
}
