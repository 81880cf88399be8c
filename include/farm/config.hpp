/**
 * @file config.hpp
 * @brief Flat "section + key = value" configuration with pluggable file formats.
 *
 * Backends are selected by tag type and compiled in per CMake option:
 *   - IniBackend  : inih               (FARM_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json      (FARM_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (FARM_CONFIG_YAML_ENABLED)
 *
 * Nested JSON/YAML objects are flattened one level: top-level keys become
 * sections, scalars at top level land in the "" section.
 *
 * Usage:
 * @code
 *   farm::Config<farm::IniBackend> cfg;
 *   if (cfg.LoadFile("farm.ini").has_value()) {
 *     uint32_t batch = cfg.GetUint32("farm", "batch_size", 10000U);
 *   }
 * @endcode
 */

#ifndef FARM_CONFIG_HPP_
#define FARM_CONFIG_HPP_

#include "farm/platform.hpp"
#include "farm/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>

#ifdef FARM_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef FARM_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef FARM_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace farm {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

// ============================================================================
// Backend tags
// ============================================================================

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool CaseEqual(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    if (AsciiLower(*a) != AsciiLower(*b)) return false;
  }
  return *a == *b;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept { return detail::CaseEqual(ext, "json"); }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef FARM_CONFIG_MAX_FILE_SIZE
#define FARM_CONFIG_MAX_FILE_SIZE 8192U
#endif

/**
 * @brief Fixed-capacity key/value table shared by all backends.
 *
 * Section and key lookups are case-insensitive. A later assignment of the
 * same section/key overwrites the earlier value.
 */
class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key, const char* fallback = "") const {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? e->value : fallback;
  }

  /// Values that are not entirely a base-10 integer yield @p fallback.
  int64_t GetInt64(const char* section, const char* key, int64_t fallback = 0) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return fallback;
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(e->value, &end, 10);
    if (end == e->value || *end != '\0' || errno == ERANGE) return fallback;
    return static_cast<int64_t>(v);
  }

  /// Negative or out-of-range values yield @p fallback.
  uint32_t GetUint32(const char* section, const char* key, uint32_t fallback = 0U) const {
    const int64_t v = GetInt64(section, key, -1);
    if (v < 0 || v > static_cast<int64_t>(UINT32_MAX)) return fallback;
    return static_cast<uint32_t>(v);
  }

  double GetDouble(const char* section, const char* key, double fallback = 0.0) const {
    double v = fallback;
    return TryGetDouble(section, key, v) ? v : fallback;
  }

  /// @brief Strict parse: false when the key is missing or not entirely a number.
  bool TryGetDouble(const char* section, const char* key, double& out) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return false;
    char* end = nullptr;
    const double v = std::strtod(e->value, &end);
    if (end == e->value || *end != '\0') return false;
    out = v;
    return true;
  }

  bool GetBool(const char* section, const char* key, bool fallback = false) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return fallback;
    return detail::CaseEqual(e->value, "true") || detail::CaseEqual(e->value, "yes") ||
           detail::CaseEqual(e->value, "on") || std::strcmp(e->value, "1") == 0;
  }

  bool HasKey(const char* section, const char* key) const { return Find(section, key) != nullptr; }

  bool HasSection(const char* section) const {
    FARM_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /// @brief Insert or overwrite one entry. Returns false when the table is full.
  bool Set(const char* section, const char* key, const char* value) {
    Entry* e = FindMutable(section, key);
    if (e == nullptr) {
      if (count_ >= kMaxEntries) return false;
      e = &entries_[count_++];
      CopyTruncated(e->section, section, kMaxNameLen);
      CopyTruncated(e->key, key, kMaxNameLen);
    }
    CopyTruncated(e->value, value, kMaxValueLen);
    return true;
  }

 protected:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxNameLen = 48;
  static constexpr uint32_t kMaxValueLen = 256;

  struct Entry {
    char section[kMaxNameLen];
    char key[kMaxNameLen];
    char value[kMaxValueLen];
  };

  static void CopyTruncated(char* dst, const char* src, uint32_t cap) noexcept {
    if (src == nullptr) src = "";
    uint32_t i = 0;
    for (; i + 1U < cap && src[i] != '\0'; ++i) dst[i] = src[i];
    dst[i] = '\0';
  }

  static expected<uint32_t, ConfigError> ReadWholeFile(const char* path, char* buf,
                                                       uint32_t cap) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    const size_t n = std::fread(buf, 1, cap - 1U, f);
    const bool truncated = (n == cap - 1U) && std::fgetc(f) != EOF;
    std::fclose(f);
    if (truncated) return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    buf[n] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(n));
  }

  static const char* Extension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

 private:
  const Entry* Find(const char* section, const char* key) const {
    FARM_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  Entry* FindMutable(const char* section, const char* key) {
    return const_cast<Entry*>(static_cast<const ConfigStore*>(this)->Find(section, key));
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Primary template: backend compiled out. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*, uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef FARM_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    const int rc = ini_parse(path, &OnEntry, &store);
    if (rc == -1) return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (rc != 0) return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t) {
    if (ini_parse_string(data, &OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  // inih convention: non-zero means "keep going".
  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    return static_cast<ConfigStore*>(user)->Set(section, name, value) ? 1 : 0;
  }
};
#endif

#ifdef FARM_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[FARM_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadWholeFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data,
                                                 uint32_t size) {
    const auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      if (!sec->is_object()) {
        if (!store.Set("", sec.key().c_str(), Scalar(*sec).c_str())) return Full();
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        if (!store.Set(sec.key().c_str(), kv.key().c_str(), Scalar(*kv).c_str())) return Full();
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Full() {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }

  static std::string Scalar(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    return n.dump();
  }
};
#endif

#ifdef FARM_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[FARM_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadWholeFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data,
                                                 uint32_t size) {
    auto root = fkyaml::node::deserialize(std::string(data, size));
    if (!root.is_mapping()) return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      const auto name = sec.key().get_value<std::string>();
      if (!sec->is_mapping()) {
        if (!store.Set("", name.c_str(), Scalar(*sec).c_str())) return Full();
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        const auto key = kv.key().get_value<std::string>();
        if (!store.Set(name.c_str(), key.c_str(), Scalar(*kv).c_str())) return Full();
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Full() {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }

  static std::string Scalar(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

/**
 * @brief Config reader over a compile-time list of backends.
 *
 * LoadFile() picks the backend from the file extension (kAuto) and falls
 * back to the first listed backend for unknown extensions.
 */
template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");
  using Primary = typename std::tuple_element<0, std::tuple<Backends...>>::type;

 public:
  expected<void, ConfigError> LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    FARM_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = Detect(path);
    return ParseFileAs<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size, ConfigFormat format) {
    FARM_ASSERT(data != nullptr);
    return ParseBufferAs<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseFileAs(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) return ParseFileAs<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseBufferAs(const char* data, uint32_t size, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0) return ParseBufferAs<Rest...>(data, size, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  static ConfigFormat Detect(const char* path) noexcept {
    const char* ext = Extension(path);
    return (ext == nullptr) ? Primary::kFormat : DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  static ConfigFormat DetectExt(const char* ext) noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Primary::kFormat;
  }
};

// ============================================================================
// Aliases for the enabled backends
// ============================================================================

#ifdef FARM_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef FARM_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef FARM_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace farm

#endif  // FARM_CONFIG_HPP_
