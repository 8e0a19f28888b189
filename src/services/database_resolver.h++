#pragma once
#include "services/provider_registry.h++"

namespace Stowage {
  struct SectionConfig {
    std::string provider;
    OptRef<ConfigMapping> connection;
  };

  // Reads `<section>.provider` and `<section>.connection` from the context's
  // configuration root
  auto read_section(
    const ProviderRegistry& registry,
    const PluginContext& context,
    std::string_view section
  ) -> SectionConfig;

  template <typename T = Database> static inline auto get_database(
    const ProviderRegistry& registry,
    const PluginContext& context,
    std::string_view section = DEFAULT_SECTION
  ) -> std::shared_ptr<T> {
    const auto cfg = read_section(registry, context, section);
    return registry.resolve<T>(cfg.provider, context, cfg.connection);
  }

  // Hands out databases for whichever component the supplier says is
  // calling, so callers never pass their own context around.
  class PluginDatabases {
  public:
    using ContextSupplier = std::function<std::shared_ptr<const PluginContext> ()>;
  private:
    ContextSupplier supplier;
    const ProviderRegistry& registry;
    auto context() const -> std::shared_ptr<const PluginContext>;
  public:
    PluginDatabases(ContextSupplier supplier, const ProviderRegistry& registry = ProviderRegistry::global())
      : supplier(std::move(supplier)), registry(registry) {}

    // Supplier is a fixed context
    PluginDatabases(std::shared_ptr<const PluginContext> ctx, const ProviderRegistry& registry = ProviderRegistry::global())
      : supplier([ctx] { return ctx; }), registry(registry) {}

    template <typename T = Database> auto get(std::string_view section = DEFAULT_SECTION) const -> std::shared_ptr<T> {
      const auto ctx = context();
      return get_database<T>(registry, *ctx, section);
    }
  };
}
