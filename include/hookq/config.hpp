/**
 * @file config.hpp
 * @brief Layered service configuration: one flat store, several file formats.
 *
 * Every format is reduced to "section + key = value" text entries. Objects
 * nested below the first level are joined with '.' into the key, so
 *
 *     {"queue": {"limits": {"concurrency": 4}}}
 *
 * lands as section "queue", key "limits.concurrency". Scalars at the top level
 * land in the empty section.
 *
 * Format support is a compile-time choice (CMake options):
 *   - IniBackend  : inih          (HOOKQ_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (HOOKQ_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (HOOKQ_CONFIG_YAML_ENABLED)
 * A disabled backend still exists as a tag; loading through it reports
 * ConfigError::kFormatNotSupported.
 *
 * @code
 *   hookq::MultiConfig cfg;
 *   if (cfg.LoadFile("hookq.ini").has_value()) { ... }
 *   cfg.SetFromEnv("PORT", "server", "port");
 *   uint16_t port = cfg.GetPort("server", "port", 3000);
 * @endcode
 */

#ifndef HOOKQ_CONFIG_HPP_
#define HOOKQ_CONFIG_HPP_

#include "hookq/log.hpp"
#include "hookq/platform.hpp"
#include "hookq/vocabulary.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <utility>

#ifdef HOOKQ_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef HOOKQ_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef HOOKQ_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace hookq {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

/// ASCII case-insensitive equality; nullptr never matches.
inline bool CaseEqual(const char* a, const char* b) noexcept {
  if (a == nullptr || b == nullptr) return false;
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    const char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a - 'A' + 'a') : *a;
    const char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b - 'A' + 'a') : *b;
    if (la != lb) return false;
  }
  return *a == *b;
}

/// Text after the last '.' of the final path component, or nullptr.
inline const char* FileExtension(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  const char* dot = std::strrchr((slash != nullptr) ? slash : path, '.');
  return (dot != nullptr && dot[1] != '\0') ? dot + 1 : nullptr;
}

inline expected<std::string, ConfigError> ReadWholeFile(const char* path) {
  FILE* f = std::fopen(path, "rb");
  if (f == nullptr) return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
  std::string text;
  char chunk[1024];
  size_t n;
  while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) text.append(chunk, n);
  const bool failed = std::ferror(f) != 0;
  (void)std::fclose(f);
  if (failed) return expected<std::string, ConfigError>::error(ConfigError::kParseError);
  return expected<std::string, ConfigError>::success(std::move(text));
}

/// Whole-token integer parse; surrounding blanks allowed.
inline bool ParseWholeInt(const char* text, long long& out) noexcept {
  char* end = nullptr;
  errno = 0;
  out = std::strtoll(text, &end, 10);
  if (end == text || errno == ERANGE) return false;
  while (*end == ' ' || *end == '\t') ++end;
  return *end == '\0';
}

inline bool ParseWholeDouble(const char* text, double& out) noexcept {
  char* end = nullptr;
  out = std::strtod(text, &end);
  if (end == text) return false;
  while (*end == ' ' || *end == '\t') ++end;
  return *end == '\0';
}

}  // namespace detail

// ============================================================================
// Format tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
#ifdef HOOKQ_CONFIG_INI_ENABLED
  static constexpr bool kEnabled = true;
#else
  static constexpr bool kEnabled = false;
#endif
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf") ||
           detail::CaseEqual(ext, "cfg");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
#ifdef HOOKQ_CONFIG_JSON_ENABLED
  static constexpr bool kEnabled = true;
#else
  static constexpr bool kEnabled = false;
#endif
  static bool MatchesExtension(const char* ext) noexcept { return detail::CaseEqual(ext, "json"); }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
#ifdef HOOKQ_CONFIG_YAML_ENABLED
  static constexpr bool kEnabled = true;
#else
  static constexpr bool kEnabled = false;
#endif
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Fixed-capacity table of section/key/value text entries.
 *
 * Lookups are case-insensitive on section and key. Typed getters return the
 * caller's default when the entry is missing or its text does not parse as a
 * whole; this is what lets a later layer with a bad value leave the earlier
 * layer's setting in force.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 128;
  static constexpr uint32_t kMaxNameLen = 63;
  static constexpr uint32_t kMaxValueLen = 255;

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const noexcept {
    const Entry* e = Lookup(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const noexcept {
    auto v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  /// Negative or unparsable text yields @p default_val; overflow saturates.
  uint32_t GetUint(const char* section, const char* key, uint32_t default_val = 0) const noexcept {
    long long v = 0;
    if (!ParsedInt(section, key, v) || v < 0) return default_val;
    return (v > 0xFFFFFFFFLL) ? 0xFFFFFFFFU : static_cast<uint32_t>(v);
  }

  /// Clamped to [0, 65535].
  uint16_t GetPort(const char* section, const char* key, uint16_t default_val = 0) const noexcept {
    long long v = 0;
    if (!ParsedInt(section, key, v)) return default_val;
    if (v < 0) return 0;
    return (v > 65535) ? static_cast<uint16_t>(65535) : static_cast<uint16_t>(v);
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const noexcept {
    auto v = FindBool(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const noexcept {
    const Entry* e = Lookup(section, key);
    double v = 0.0;
    return (e != nullptr && detail::ParseWholeDouble(e->value.c_str(), v)) ? v : default_val;
  }

  optional<int32_t> FindInt(const char* section, const char* key) const noexcept {
    long long v = 0;
    if (!ParsedInt(section, key, v) || v < INT32_MIN || v > INT32_MAX) return {};
    return optional<int32_t>(static_cast<int32_t>(v));
  }

  /// true/yes/on/1 and false/no/off/0; anything else is absent.
  optional<bool> FindBool(const char* section, const char* key) const noexcept {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) return {};
    const char* t = e->value.c_str();
    if (detail::CaseEqual(t, "true") || detail::CaseEqual(t, "yes") ||
        detail::CaseEqual(t, "on") || detail::CaseEqual(t, "1")) {
      return optional<bool>(true);
    }
    if (detail::CaseEqual(t, "false") || detail::CaseEqual(t, "no") ||
        detail::CaseEqual(t, "off") || detail::CaseEqual(t, "0")) {
      return optional<bool>(false);
    }
    return {};
  }

  bool HasSection(const char* section) const noexcept {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const noexcept {
    return Lookup(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /// @brief Insert or overwrite. kBufferFull only for a new entry in a full table.
  expected<void, ConfigError> Set(const char* section, const char* key,
                                  const char* value) noexcept {
    if (section == nullptr || key == nullptr) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    Entry* e = const_cast<Entry*>(Lookup(section, key));
    if (e == nullptr) {
      if (count_ == kMaxEntries) return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      e = &entries_[count_++];
      e->section.assign(section);
      e->key.assign(key);
    }
    e->value.assign((value != nullptr) ? value : "");
    return expected<void, ConfigError>::success();
  }

  /**
   * @brief Copy environment variable @p env_name into section.key.
   * @return true when the variable was set, non-empty and stored.
   */
  bool SetFromEnv(const char* env_name, const char* section, const char* key) noexcept {
    HOOKQ_ASSERT(env_name != nullptr);
    const char* val = std::getenv(env_name);
    if (val == nullptr || val[0] == '\0') return false;
    return Set(section, key, val).has_value();
  }

 private:
  struct Entry {
    FixedString<kMaxNameLen> section;
    FixedString<kMaxNameLen> key;
    FixedString<kMaxValueLen> value;
  };

  const Entry* Lookup(const char* section, const char* key) const noexcept {
    for (uint32_t i = 0; i < count_; ++i) {
      const Entry& e = entries_[i];
      if (detail::CaseEqual(e.section.c_str(), section) && detail::CaseEqual(e.key.c_str(), key)) {
        return &e;
      }
    }
    return nullptr;
  }

  bool ParsedInt(const char* section, const char* key, long long& out) const noexcept {
    const Entry* e = Lookup(section, key);
    return e != nullptr && detail::ParseWholeInt(e->value.c_str(), out);
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Fallback for a format that was not compiled in.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> Parse(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef HOOKQ_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    Sink sink{&store, false};
    const int line = ini_parse_string(text.c_str(), &OnEntry, &sink);
    if (sink.full) return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    if (line != 0) return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  struct Sink {
    ConfigStore* store;
    bool full;
  };

  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    auto* sink = static_cast<Sink*>(user);
    if (sink->store->Set(section, name, value).has_value()) return 1;
    sink->full = true;
    return 0;
  }
};
#endif

#ifdef HOOKQ_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    const nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (const auto& item : root.items()) {
      const bool ok = item.value().is_object()
                          ? Flatten(store, item.key(), std::string(), item.value())
                          : Put(store, std::string(), item.key(), item.value());
      if (!ok) return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const std::string& section, const std::string& prefix,
                      const nlohmann::json& obj) {
    for (const auto& item : obj.items()) {
      const std::string key = prefix.empty() ? item.key() : prefix + "." + item.key();
      const bool ok = item.value().is_object() ? Flatten(store, section, key, item.value())
                                               : Put(store, section, key, item.value());
      if (!ok) return false;
    }
    return true;
  }

  static bool Put(ConfigStore& store, const std::string& section, const std::string& key,
                  const nlohmann::json& v) {
    const std::string text = v.is_string() ? v.get<std::string>() : v.dump();
    return store.Set(section.c_str(), key.c_str(), text.c_str()).has_value();
  }
};
#endif

#ifdef HOOKQ_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(text);
    } catch (const fkyaml::exception& e) {
      HOOKQ_LOG_ERROR("config", "yaml: %s", e.what());
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = root.begin(); it != root.end(); ++it) {
      const std::string name = it.key().get_value<std::string>();
      const bool ok = it->is_mapping() ? Flatten(store, name, std::string(), *it)
                                       : Put(store, std::string(), name, *it);
      if (!ok) return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const std::string& section, const std::string& prefix,
                      const fkyaml::node& map) {
    for (auto it = map.begin(); it != map.end(); ++it) {
      const std::string name = it.key().get_value<std::string>();
      const std::string key = prefix.empty() ? name : prefix + "." + name;
      const bool ok = it->is_mapping() ? Flatten(store, section, key, *it)
                                       : Put(store, section, key, *it);
      if (!ok) return false;
    }
    return true;
  }

  static bool Put(ConfigStore& store, const std::string& section, const std::string& key,
                  const fkyaml::node& v) {
    std::string text;
    if (v.is_string()) {
      text = v.get_value<std::string>();
    } else if (v.is_boolean()) {
      text = v.get_value<bool>() ? "true" : "false";
    } else if (v.is_integer()) {
      text = std::to_string(v.get_value<int64_t>());
    } else if (v.is_float_number()) {
      char buf[32];
      (void)std::snprintf(buf, sizeof(buf), "%.17g", v.get_value<double>());
      text = buf;
    }
    return store.Set(section.c_str(), key.c_str(), text.c_str()).has_value();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

/**
 * @brief ConfigStore that loads files and buffers through @p Backends.
 *
 * Each load overlays the store; a later load wins for keys it defines. With
 * ConfigFormat::kAuto the file extension picks the backend, and the first
 * backend is used when no extension matches.
 */
template <typename First, typename... Rest>
class Config final : public ConfigStore {
 public:
  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    HOOKQ_ASSERT(path != nullptr);
    auto text = detail::ReadWholeFile(path);
    if (!text.has_value()) return expected<void, ConfigError>::error(text.get_error());
    if (format == ConfigFormat::kAuto) format = FormatFor(detail::FileExtension(path));
    return Dispatch(format, text.value());
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size, ConfigFormat format) {
    HOOKQ_ASSERT(data != nullptr);
    return Dispatch(format, std::string(data, size));
  }

 private:
  static ConfigFormat FormatFor(const char* ext) noexcept {
    if (ext == nullptr) return First::kFormat;
    ConfigFormat found = First::kFormat;
    const bool matched = First::MatchesExtension(ext) ||
                         ((Rest::MatchesExtension(ext) && (found = Rest::kFormat, true)) || ...);
    (void)matched;
    return found;
  }

  expected<void, ConfigError> Dispatch(ConfigFormat format, const std::string& text) {
    auto result = expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
    (void)(TryParse<First>(format, text, result) || ... || TryParse<Rest>(format, text, result));
    return result;
  }

  template <typename Backend>
  bool TryParse(ConfigFormat format, const std::string& text,
                expected<void, ConfigError>& result) {
    if (Backend::kFormat != format) return false;
    result = ConfigParser<Backend>::Parse(*this, text);
    return true;
  }
};

/// Every format; the ones not compiled in answer kFormatNotSupported.
using MultiConfig = Config<IniBackend, JsonBackend, YamlBackend>;

}  // namespace hookq

#endif  // HOOKQ_CONFIG_HPP_
