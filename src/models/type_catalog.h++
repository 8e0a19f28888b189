#pragma once
#include "models/table.h++"
#include "util/config.h++"
#include <shared_mutex>
#include <unordered_map>

namespace Stowage {
  struct TypeInfo {
    std::string name;
    // Present iff the type is marked as a table
    std::optional<Table> table;
  };

  // The set of record types a host can load by name. Types that are not
  // registered here do not exist as far as entity scanning is concerned.
  class TypeCatalog {
  private:
    mutable std::shared_mutex lock;
    std::unordered_map<std::string, std::shared_ptr<const TypeInfo>> types;
  public:
    TypeCatalog() = default;
    TypeCatalog(const TypeCatalog&) = delete;
    auto operator=(const TypeCatalog&) = delete;

    static auto global() -> TypeCatalog&;
    static auto from_config(const ConfigValue& types) -> std::shared_ptr<TypeCatalog>;

    auto add(TypeInfo info) -> void;
    template <typename T> auto add_record() -> void {
      const Table& table = RecordTraits<T>::table();
      add({ table.type_name(), table });
    }
    auto load(std::string_view name) const -> std::shared_ptr<const TypeInfo>;
    auto size() const -> size_t;

    static inline auto is_table(const TypeInfo& type) noexcept -> bool {
      return type.table.has_value();
    }
  };
}
