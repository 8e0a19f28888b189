#include "type_catalog.h++"

using std::make_shared, std::optional, std::shared_lock, std::shared_ptr,
    std::string, std::string_view, std::unique_lock, std::vector;

namespace Stowage {
  auto TypeCatalog::global() -> TypeCatalog& {
    static TypeCatalog catalog;
    return catalog;
  }

  auto TypeCatalog::add(TypeInfo info) -> void {
    if (!is_qualified_name(info.name)) {
      throw StowageError(fmt::format("Invalid record type name '{}'", info.name));
    }
    if (info.table && info.table->type_name() != info.name) {
      throw StowageError(fmt::format(
        "Type {} carries a table descriptor for {}", info.name, info.table->type_name()
      ));
    }
    unique_lock<std::shared_mutex> l(lock);
    auto name = info.name;
    types.insert_or_assign(std::move(name), make_shared<const TypeInfo>(std::move(info)));
  }

  auto TypeCatalog::load(string_view name) const -> shared_ptr<const TypeInfo> {
    shared_lock<std::shared_mutex> l(lock);
    const auto it = types.find(string(name));
    if (it == types.end()) return nullptr;
    return it->second;
  }

  auto TypeCatalog::size() const -> size_t {
    shared_lock<std::shared_mutex> l(lock);
    return types.size();
  }

  static auto column_from_config(const ConfigValue& value, string_view type_name) -> Column {
    const auto& map = value.as_mapping();
    const auto name = config_string(map, "name");
    if (!name) throw ConfigError(fmt::format("Column of type {} has no 'name'", type_name));
    const auto type_str = config_string(map, "type");
    if (!type_str) throw ConfigError(fmt::format("Column {} of type {} has no 'type'", *name, type_name));
    const auto type = column_type_from_name(*type_str);
    if (!type) throw ConfigError(fmt::format("Column {} of type {} has unknown type '{}'", *name, type_name, *type_str));
    return {
      .name = *name,
      .type = *type,
      .primary_key = config_bool(map, "primary_key", false),
      .nullable = config_bool(map, "nullable", true)
    };
  }

  auto TypeCatalog::from_config(const ConfigValue& value) -> shared_ptr<TypeCatalog> {
    auto catalog = make_shared<TypeCatalog>();
    if (value.is_null()) return catalog;
    for (const auto& entry : value.as_sequence()) {
      const auto& map = entry.as_mapping();
      const auto name = config_string(map, "name");
      if (!name) throw ConfigError("Every entry in 'types' needs a 'name'");
      if (!is_qualified_name(*name)) throw ConfigError(fmt::format("Invalid type name '{}'", *name));
      optional<Table> table;
      if (const auto table_name = config_string(map, "table")) {
        vector<Column> columns;
        if (const auto cols = config_get(map, "columns")) {
          for (const auto& col : cols->get().as_sequence()) {
            columns.push_back(column_from_config(col, *name));
          }
        }
        try {
          table.emplace(*name, *table_name, std::move(columns));
        } catch (const StowageError& e) {
          throw ConfigError(e.what());
        }
      }
      catalog->add({ *name, std::move(table) });
    }
    spdlog::debug("Loaded {:d} record types from config", catalog->size());
    return catalog;
  }
}
