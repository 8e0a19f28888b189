#pragma once
#include "util/errors.h++"
#include <filesystem>
#include <map>
#include <variant>

namespace Stowage {
  class ConfigValue;
  using ConfigSequence = std::vector<ConfigValue>;
  using ConfigMapping = std::map<std::string, ConfigValue, std::less<>>;

  class ConfigValue {
  public:
    using Variant = std::variant<std::monostate, bool, int64_t, double, std::string, ConfigSequence, ConfigMapping>;
  private:
    Variant value;
  public:
    ConfigValue() : value(std::monostate{}) {}
    ConfigValue(bool b) : value(b) {}
    ConfigValue(int v) : value((int64_t)v) {}
    ConfigValue(int64_t v) : value(v) {}
    ConfigValue(double v) : value(v) {}
    ConfigValue(const char* s) : value(std::string(s)) {}
    ConfigValue(std::string s) : value(std::move(s)) {}
    ConfigValue(ConfigSequence seq) : value(std::move(seq)) {}
    ConfigValue(ConfigMapping map) : value(std::move(map)) {}

    static auto parse_json(std::string_view json) -> ConfigValue;
    static auto load_json_file(const std::filesystem::path& path) -> ConfigValue;

    auto variant() const noexcept -> const Variant& { return value; }
    auto kind_name() const noexcept -> std::string_view;

    auto is_null() const noexcept -> bool { return std::holds_alternative<std::monostate>(value); }
    auto is_bool() const noexcept -> bool { return std::holds_alternative<bool>(value); }
    auto is_int() const noexcept -> bool { return std::holds_alternative<int64_t>(value); }
    auto is_number() const noexcept -> bool { return is_int() || std::holds_alternative<double>(value); }
    auto is_string() const noexcept -> bool { return std::holds_alternative<std::string>(value); }
    auto is_sequence() const noexcept -> bool { return std::holds_alternative<ConfigSequence>(value); }
    auto is_mapping() const noexcept -> bool { return std::holds_alternative<ConfigMapping>(value); }

    auto as_bool() const -> bool;
    auto as_int() const -> int64_t;
    auto as_double() const -> double;
    auto as_string() const -> const std::string&;
    auto as_sequence() const -> const ConfigSequence&;
    auto as_mapping() const -> const ConfigMapping&;
    auto as_string_list() const -> std::vector<std::string>;

    auto get(std::string_view key) const -> OptRef<ConfigValue>;
  };

  static inline auto config_get(const ConfigMapping& map, std::string_view key) -> OptRef<ConfigValue> {
    const auto it = map.find(key);
    if (it == map.end() || it->second.is_null()) return {};
    return std::cref(it->second);
  }

  static inline auto config_string(const ConfigMapping& map, std::string_view key) -> std::optional<std::string> {
    if (auto v = config_get(map, key)) {
      if (!v->get().is_string()) throw ConfigError(fmt::format("'{}' must be a string", key));
      return v->get().as_string();
    }
    return {};
  }

  // Booleans may also be written as the strings "true"/"false", as YAML-derived configs often are
  auto config_bool(const ConfigMapping& map, std::string_view key, bool default_value) -> bool;

  struct ScanConfig {
    bool autoscan = false;
    std::optional<std::string> package;
    std::vector<std::string> tables;

    static auto from(OptRef<ConfigMapping> connection) -> ScanConfig;
  };

  struct LmdbConfig {
    std::filesystem::path file;
    size_t map_size_mb = 1024;
    ScanConfig scan;

    static auto from(OptRef<ConfigMapping> connection) -> LmdbConfig;
  };

  struct PostgresConfig {
    std::optional<std::string> conninfo, host, port, database, user, password;
    ScanConfig scan;

    static auto from(OptRef<ConfigMapping> connection) -> PostgresConfig;
    auto connection_string() const -> std::string;
  };
}
