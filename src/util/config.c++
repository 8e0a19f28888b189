#include "config.h++"
#include <simdjson.h>

using std::optional, std::string, std::string_view, std::vector;
using namespace std::literals::string_view_literals;

namespace Stowage {
  static auto from_simdjson(simdjson::ondemand::value value) -> ConfigValue {
    using simdjson::ondemand::json_type, simdjson::ondemand::number_type;
    switch (value.type().value()) {
      case json_type::null:
        return {};
      case json_type::boolean:
        return ConfigValue(value.get_bool().value());
      case json_type::number:
        switch (value.get_number_type().value()) {
          case number_type::signed_integer:
            return ConfigValue(value.get_int64().value());
          case number_type::unsigned_integer:
            throw ConfigError("Integer in config is out of range");
          default:
            return ConfigValue(value.get_double().value());
        }
      case json_type::string:
        return ConfigValue(string(value.get_string().value()));
      case json_type::array: {
        ConfigSequence seq;
        for (auto item : value.get_array()) seq.push_back(from_simdjson(item.value()));
        return ConfigValue(std::move(seq));
      }
      case json_type::object: {
        ConfigMapping map;
        for (auto field : value.get_object()) {
          string key(field.unescaped_key().value());
          map.insert_or_assign(std::move(key), from_simdjson(field.value()));
        }
        return ConfigValue(std::move(map));
      }
      default:
        throw ConfigError("Unsupported JSON value in config");
    }
  }

  static auto parse_padded(const simdjson::padded_string& json) -> ConfigValue {
    simdjson::ondemand::parser parser;
    try {
      auto doc = parser.iterate(json);
      auto value = from_simdjson(doc.get_value().value());
      if (!doc.at_end()) throw ConfigError("Invalid JSON config: unexpected content after the root value");
      return value;
    } catch (const simdjson::simdjson_error& e) {
      throw ConfigError(fmt::format("Invalid JSON config: {}", e.what()));
    }
  }

  auto ConfigValue::parse_json(string_view json) -> ConfigValue {
    return parse_padded(simdjson::padded_string(json));
  }

  auto ConfigValue::load_json_file(const std::filesystem::path& path) -> ConfigValue {
    simdjson::padded_string json;
    if (auto err = simdjson::padded_string::load(path.string()).get(json)) {
      throw ConfigError(fmt::format("Could not read config file {}: {}", path.string(), simdjson::error_message(err)));
    }
    spdlog::debug("Loaded config file {}", path.string());
    return parse_padded(json);
  }

  auto ConfigValue::kind_name() const noexcept -> string_view {
    return std::visit(overload{
      [](std::monostate) { return "null"sv; },
      [](bool) { return "boolean"sv; },
      [](int64_t) { return "integer"sv; },
      [](double) { return "number"sv; },
      [](const string&) { return "string"sv; },
      [](const ConfigSequence&) { return "sequence"sv; },
      [](const ConfigMapping&) { return "mapping"sv; }
    }, value);
  }

  auto ConfigValue::as_bool() const -> bool {
    if (auto* b = std::get_if<bool>(&value)) return *b;
    throw ConfigError(fmt::format("Expected boolean, got {}", kind_name()));
  }

  auto ConfigValue::as_int() const -> int64_t {
    if (auto* i = std::get_if<int64_t>(&value)) return *i;
    throw ConfigError(fmt::format("Expected integer, got {}", kind_name()));
  }

  auto ConfigValue::as_double() const -> double {
    if (auto* i = std::get_if<int64_t>(&value)) return (double)*i;
    if (auto* d = std::get_if<double>(&value)) return *d;
    throw ConfigError(fmt::format("Expected number, got {}", kind_name()));
  }

  auto ConfigValue::as_string() const -> const string& {
    if (auto* s = std::get_if<string>(&value)) return *s;
    throw ConfigError(fmt::format("Expected string, got {}", kind_name()));
  }

  auto ConfigValue::as_sequence() const -> const ConfigSequence& {
    if (auto* s = std::get_if<ConfigSequence>(&value)) return *s;
    throw ConfigError(fmt::format("Expected sequence, got {}", kind_name()));
  }

  auto ConfigValue::as_mapping() const -> const ConfigMapping& {
    if (auto* m = std::get_if<ConfigMapping>(&value)) return *m;
    throw ConfigError(fmt::format("Expected mapping, got {}", kind_name()));
  }

  auto ConfigValue::as_string_list() const -> vector<string> {
    vector<string> out;
    for (const auto& item : as_sequence()) out.push_back(item.as_string());
    return out;
  }

  auto ConfigValue::get(string_view key) const -> OptRef<ConfigValue> {
    if (auto* m = std::get_if<ConfigMapping>(&value)) return config_get(*m, key);
    return {};
  }

  auto config_bool(const ConfigMapping& map, string_view key, bool default_value) -> bool {
    const auto v = config_get(map, key);
    if (!v) return default_value;
    const auto& val = v->get();
    if (val.is_bool()) return val.as_bool();
    if (val.is_string()) {
      const auto s = to_ascii_lowercase(val.as_string());
      if (s == "true") return true;
      if (s == "false") return false;
    }
    throw ConfigError(fmt::format("'{}' must be a boolean", key));
  }

  auto ScanConfig::from(OptRef<ConfigMapping> connection) -> ScanConfig {
    ScanConfig cfg;
    if (!connection) {
      throw ConfigError("Table configuration requires a 'connection' section with 'autoscan' or 'tables'");
    }
    const auto& map = connection->get();
    cfg.autoscan = config_bool(map, "autoscan", false);
    cfg.package = config_string(map, "package");
    if (cfg.autoscan) return cfg;
    const auto tables = config_get(map, "tables");
    if (!tables || !tables->get().is_sequence()) {
      throw ConfigError("'tables' must be a sequence of type names when 'autoscan' is false");
    }
    try {
      cfg.tables = tables->get().as_string_list();
    } catch (const ConfigError&) {
      throw ConfigError("'tables' must be a sequence of type names when 'autoscan' is false");
    }
    return cfg;
  }

  auto LmdbConfig::from(OptRef<ConfigMapping> connection) -> LmdbConfig {
    LmdbConfig cfg;
    if (!connection) throw ConfigError("lmdb provider requires a 'connection' section");
    const auto& map = connection->get();
    const auto file = config_string(map, "file");
    if (!file || file->empty()) throw ConfigError("lmdb provider requires a 'file' value");
    cfg.file = *file;
    if (auto size = config_get(map, "map_size_mb")) {
      const auto n = size->get().as_int();
      if (n <= 0) throw ConfigError("'map_size_mb' must be positive");
      if ((uint64_t)n > SIZE_MAX / MiB) throw ConfigError("'map_size_mb' is too large");
      cfg.map_size_mb = (size_t)n;
    }
    cfg.scan = ScanConfig::from(connection);
    return cfg;
  }

  auto PostgresConfig::from(OptRef<ConfigMapping> connection) -> PostgresConfig {
    PostgresConfig cfg;
    if (!connection) throw ConfigError("postgres provider requires a 'connection' section");
    const auto& map = connection->get();
    cfg.conninfo = config_string(map, "conninfo");
    cfg.host = config_string(map, "host");
    if (auto port = config_get(map, "port")) {
      cfg.port = port->get().is_int() ? std::to_string(port->get().as_int()) : port->get().as_string();
    }
    cfg.database = config_string(map, "database");
    cfg.user = config_string(map, "user");
    cfg.password = config_string(map, "password");
    cfg.scan = ScanConfig::from(connection);
    return cfg;
  }

  static inline auto conninfo_quote(string_view value) -> string {
    string out = "'";
    for (char c : value) {
      if (c == '\'' || c == '\\') out += '\\';
      out += c;
    }
    out += '\'';
    return out;
  }

  auto PostgresConfig::connection_string() const -> string {
    string out = conninfo.value_or("");
    const auto add = [&](string_view key, const optional<string>& value) {
      if (!value) return;
      if (!out.empty()) out += ' ';
      out += fmt::format("{}={}", key, conninfo_quote(*value));
    };
    add("host", host);
    add("port", port);
    add("dbname", database);
    add("user", user);
    add("password", password);
    return out;
  }
}
