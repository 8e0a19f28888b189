#pragma once
#include "db/database.h++"
#include "services/plugin_context.h++"
#include <map>
#include <shared_mutex>
#include <typeinfo>

namespace Stowage {
  class Provider {
  public:
    virtual ~Provider() = default;
    // `context` may be empty for providers that do not need one;
    // `connection` is empty when the configuration has no connection section.
    // Throws BackendConstructionError (or ConfigError) on failure.
    virtual auto get(
      OptRef<PluginContext> context,
      OptRef<ConfigMapping> connection
    ) -> std::shared_ptr<Database> = 0;
  };

  template <typename T> static inline auto database_kind_name() -> std::string_view {
    if constexpr (std::is_same_v<T, RelationalDatabase>) return "relational database";
    else if constexpr (std::is_same_v<T, KeyValueDatabase>) return "key-value database";
    else if constexpr (std::is_same_v<T, Database>) return "database";
    else return typeid(T).name();
  }

  class ProviderRegistry {
  public:
    using Snapshot = std::map<std::string, std::shared_ptr<Provider>, std::less<>>;
  private:
    mutable std::shared_mutex lock;
    Snapshot providers;
    auto lookup(std::string_view name) const -> std::shared_ptr<Provider>;
  public:
    ProviderRegistry() = default;
    ProviderRegistry(const ProviderRegistry&) = delete;
    auto operator=(const ProviderRegistry&) = delete;

    // Process-wide registry with the built-in providers (map, lmdb, postgres)
    static auto global() -> ProviderRegistry&;

    auto register_provider(std::string name, std::shared_ptr<Provider> provider) -> void;
    auto unregister_provider(std::string_view name) -> std::shared_ptr<Provider>;
    auto has_provider(std::string_view name) const -> bool;
    auto provider_names() const -> std::vector<std::string>;

    auto snapshot() const -> Snapshot;
    auto restore(Snapshot snapshot) -> void;

    auto resolve(
      std::string_view name,
      OptRef<PluginContext> context,
      OptRef<ConfigMapping> connection
    ) const -> std::shared_ptr<Database>;

    template <typename T> auto resolve(
      std::string_view name,
      OptRef<PluginContext> context,
      OptRef<ConfigMapping> connection
    ) const -> std::shared_ptr<T> {
      auto db = resolve(name, context, connection);
      auto typed = std::dynamic_pointer_cast<T>(db);
      if (!typed) throw TypeMismatch(std::string(name), database_kind_name<T>());
      return typed;
    }
  };

  auto register_builtin_providers(ProviderRegistry& registry) -> void;
}
