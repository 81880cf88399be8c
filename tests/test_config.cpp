/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - section/key store and file-format backends.
 */

#include "farm/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore typed getters", "[config]") {
  farm::Config<farm::IniBackend> cfg;
  REQUIRE(cfg.Set("farm", "target", "1000064"));
  REQUIRE(cfg.Set("farm", "batch_size", "10000"));
  REQUIRE(cfg.Set("farm", "mean", "18.5"));
  REQUIRE(cfg.Set("farm", "verbose", "yes"));
  REQUIRE(cfg.Set("farm", "mode", "thread"));

  REQUIRE(cfg.GetInt64("farm", "target") == 1000064);
  REQUIRE(cfg.GetUint32("farm", "batch_size") == 10000U);
  REQUIRE(cfg.GetDouble("farm", "mean") == 18.5);
  REQUIRE(cfg.GetBool("farm", "verbose"));
  REQUIRE(std::strcmp(cfg.GetString("farm", "mode"), "thread") == 0);
  REQUIRE(cfg.EntryCount() == 5U);
}

TEST_CASE("ConfigStore fallbacks", "[config]") {
  farm::Config<farm::IniBackend> cfg;
  REQUIRE(cfg.Set("farm", "workers", "-3"));
  REQUIRE(cfg.Set("farm", "target", "lots"));

  REQUIRE(std::strcmp(cfg.GetString("x", "y", "default"), "default") == 0);
  REQUIRE(cfg.GetInt64("x", "y", 42) == 42);
  REQUIRE(cfg.GetInt64("farm", "target", 7) == 7);
  REQUIRE(cfg.GetUint32("farm", "workers", 9U) == 9U);
  REQUIRE(cfg.GetDouble("farm", "missing", 2.5) == 2.5);
  REQUIRE_FALSE(cfg.GetBool("farm", "missing"));
}

TEST_CASE("ConfigStore numbers must be the whole value", "[config]") {
  farm::Config<farm::IniBackend> cfg;
  REQUIRE(cfg.Set("farm", "target", "12abc"));
  REQUIRE(cfg.Set("farm", "batch_size", "10k"));
  REQUIRE(cfg.Set("farm", "mean", "abc"));
  REQUIRE(cfg.Set("farm", "scale", "1.5x"));
  REQUIRE(cfg.Set("farm", "offset", "-0.25"));

  REQUIRE(cfg.GetInt64("farm", "target", 7) == 7);
  REQUIRE(cfg.GetUint32("farm", "batch_size", 9U) == 9U);
  REQUIRE(cfg.GetDouble("farm", "mean", 2.5) == 2.5);

  double v = 4.0;
  REQUIRE_FALSE(cfg.TryGetDouble("farm", "mean", v));
  REQUIRE_FALSE(cfg.TryGetDouble("farm", "scale", v));
  REQUIRE_FALSE(cfg.TryGetDouble("farm", "missing", v));
  REQUIRE(v == 4.0);
  REQUIRE(cfg.TryGetDouble("farm", "offset", v));
  REQUIRE(v == -0.25);
}

TEST_CASE("ConfigStore lookups are case-insensitive", "[config]") {
  farm::Config<farm::IniBackend> cfg;
  REQUIRE(cfg.Set("Farm", "Workers", "4"));
  REQUIRE(cfg.GetUint32("farm", "workers") == 4U);
  REQUIRE(cfg.GetUint32("FARM", "WORKERS") == 4U);
  REQUIRE(cfg.HasSection("farm"));
  REQUIRE_FALSE(cfg.HasSection("log"));
  REQUIRE(cfg.HasKey("farm", "workers"));
}

TEST_CASE("ConfigStore overwrite keeps one entry", "[config]") {
  farm::Config<farm::IniBackend> cfg;
  REQUIRE(cfg.Set("s", "k", "v1"));
  REQUIRE(cfg.Set("s", "k", "v2"));
  REQUIRE(cfg.EntryCount() == 1U);
  REQUIRE(std::strcmp(cfg.GetString("s", "k"), "v2") == 0);
}

TEST_CASE("ConfigStore rejects entries past capacity", "[config]") {
  farm::Config<farm::IniBackend> cfg;
  char key[16];
  bool all_ok = true;
  for (int i = 0; i < 64; ++i) {
    std::snprintf(key, sizeof(key), "k%d", i);
    all_ok = all_ok && cfg.Set("s", key, "v");
  }
  REQUIRE(all_ok);
  REQUIRE_FALSE(cfg.Set("s", "one_more", "v"));
  REQUIRE(cfg.Set("s", "k0", "updated"));
}

TEST_CASE("Backend extension matching", "[config][tag]") {
  REQUIRE(farm::IniBackend::MatchesExtension("ini"));
  REQUIRE(farm::IniBackend::MatchesExtension("CONF"));
  REQUIRE_FALSE(farm::IniBackend::MatchesExtension("json"));
  REQUIRE(farm::JsonBackend::MatchesExtension("json"));
  REQUIRE(farm::YamlBackend::MatchesExtension("yml"));
  REQUIRE(farm::YamlBackend::MatchesExtension("yaml"));
}

TEST_CASE("Format not in the backend list is unsupported", "[config]") {
  farm::Config<farm::IniBackend> cfg;
  auto r = cfg.LoadBuffer("{}", 2, farm::ConfigFormat::kJson);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::ConfigError::kFormatNotSupported);
}

// ============================================================================
// INI Backend
// ============================================================================

#ifdef FARM_CONFIG_INI_ENABLED

TEST_CASE("INI LoadBuffer", "[config][ini]") {
  const char* ini =
      "[farm]\n"
      "target = 25\n"
      "batch_size = 10\n"
      "; comment\n"
      "[log]\n"
      "level = debug\n";

  farm::IniConfig cfg;
  auto r = cfg.LoadBuffer(ini, static_cast<uint32_t>(std::strlen(ini)), farm::ConfigFormat::kIni);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetInt64("farm", "target") == 25);
  REQUIRE(cfg.GetUint32("farm", "batch_size") == 10U);
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "debug") == 0);
}

TEST_CASE("INI LoadFile", "[config][ini]") {
  const char* path = "/tmp/__farm_test_config__.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "[farm]\nworkers = 3\nmode = process\n");
  std::fclose(f);

  farm::IniConfig cfg;
  auto r = cfg.LoadFile(path);
  std::remove(path);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetUint32("farm", "workers") == 3U);
  REQUIRE(std::strcmp(cfg.GetString("farm", "mode"), "process") == 0);
}

TEST_CASE("INI LoadFile missing", "[config][ini]") {
  farm::IniConfig cfg;
  auto r = cfg.LoadFile("/tmp/__farm_nonexistent__.ini");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::ConfigError::kFileNotFound);
}

TEST_CASE("INI malformed line", "[config][ini]") {
  const char* ini = "[farm\ntarget 25\n";
  farm::IniConfig cfg;
  auto r = cfg.LoadBuffer(ini, static_cast<uint32_t>(std::strlen(ini)), farm::ConfigFormat::kIni);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::ConfigError::kParseError);
}

#endif  // FARM_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend
// ============================================================================

#ifdef FARM_CONFIG_JSON_ENABLED

TEST_CASE("JSON sections and scalars", "[config][json]") {
  const char* json = R"({
    "farm": { "target": 25, "mean": 2.5, "mode": "thread", "verbose": true },
    "top": "level"
  })";
  farm::JsonConfig cfg;
  auto r = cfg.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)), farm::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetInt64("farm", "target") == 25);
  REQUIRE(cfg.GetDouble("farm", "mean") == 2.5);
  REQUIRE(std::strcmp(cfg.GetString("farm", "mode"), "thread") == 0);
  REQUIRE(cfg.GetBool("farm", "verbose"));
  REQUIRE(std::strcmp(cfg.GetString("", "top"), "level") == 0);
}

TEST_CASE("JSON parse error", "[config][json]") {
  const char* json = "{ \"farm\": ";
  farm::JsonConfig cfg;
  auto r = cfg.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)), farm::ConfigFormat::kJson);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::ConfigError::kParseError);
}

#endif  // FARM_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend
// ============================================================================

#ifdef FARM_CONFIG_YAML_ENABLED

TEST_CASE("YAML sections and scalars", "[config][yaml]") {
  const char* yaml =
      "farm:\n"
      "  target: 25\n"
      "  mode: process\n"
      "  verbose: true\n";
  farm::YamlConfig cfg;
  auto r = cfg.LoadBuffer(yaml, static_cast<uint32_t>(std::strlen(yaml)), farm::ConfigFormat::kYaml);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetInt64("farm", "target") == 25);
  REQUIRE(std::strcmp(cfg.GetString("farm", "mode"), "process") == 0);
  REQUIRE(cfg.GetBool("farm", "verbose"));
}

#endif  // FARM_CONFIG_YAML_ENABLED
