#include "provider_registry.h++"
#include "services/map_database.h++"
#include "services/lmdb_database.h++"
#include "services/postgres_database.h++"
#include <mutex>

using std::make_shared, std::shared_lock, std::shared_mutex, std::shared_ptr,
    std::string, std::string_view, std::unique_lock, std::vector;

namespace Stowage {
  auto ProviderRegistry::global() -> ProviderRegistry& {
    static ProviderRegistry registry;
    static std::once_flag builtins;
    std::call_once(builtins, [] { register_builtin_providers(registry); });
    return registry;
  }

  auto register_builtin_providers(ProviderRegistry& registry) -> void {
    registry.register_provider("map", make_shared<MapProvider>());
    registry.register_provider("lmdb", make_shared<LmdbProvider>());
    registry.register_provider("postgres", make_shared<PostgresProvider>());
  }

  auto ProviderRegistry::register_provider(string name, shared_ptr<Provider> provider) -> void {
    unique_lock<shared_mutex> l(lock);
    providers.insert_or_assign(std::move(name), std::move(provider));
  }

  auto ProviderRegistry::unregister_provider(string_view name) -> shared_ptr<Provider> {
    unique_lock<shared_mutex> l(lock);
    const auto it = providers.find(name);
    if (it == providers.end()) return nullptr;
    auto provider = std::move(it->second);
    providers.erase(it);
    return provider;
  }

  auto ProviderRegistry::has_provider(string_view name) const -> bool {
    shared_lock<shared_mutex> l(lock);
    return providers.contains(name);
  }

  auto ProviderRegistry::provider_names() const -> vector<string> {
    shared_lock<shared_mutex> l(lock);
    vector<string> names;
    names.reserve(providers.size());
    for (const auto& [name, _] : providers) names.push_back(name);
    return names;
  }

  auto ProviderRegistry::snapshot() const -> Snapshot {
    shared_lock<shared_mutex> l(lock);
    return providers;
  }

  auto ProviderRegistry::restore(Snapshot snapshot) -> void {
    unique_lock<shared_mutex> l(lock);
    providers = std::move(snapshot);
  }

  auto ProviderRegistry::lookup(string_view name) const -> shared_ptr<Provider> {
    shared_lock<shared_mutex> l(lock);
    const auto it = providers.find(name);
    return it == providers.end() ? nullptr : it->second;
  }

  auto ProviderRegistry::resolve(
    string_view name,
    OptRef<PluginContext> context,
    OptRef<ConfigMapping> connection
  ) const -> shared_ptr<Database> {
    // The provider runs outside the lock; it may open files or sockets
    const auto provider = lookup(name);
    if (!provider) throw ProviderNotFound(string(name), join(provider_names()));
    auto db = provider->get(context, connection);
    if (!db) throw ProviderReturnedInvalid(string(name));
    spdlog::debug(
      "Resolved database provider {}{}", name,
      context ? fmt::format(" for {}", context->get().name) : ""
    );
    return db;
  }
}
