#include "database_resolver.h++"

using std::shared_ptr, std::string, std::string_view;

namespace Stowage {
  auto read_section(
    const ProviderRegistry& registry,
    const PluginContext& context,
    string_view section
  ) -> SectionConfig {
    const auto section_value = context.config.get(section);
    if (!section_value || !section_value->get().is_mapping()) {
      throw MissingProviderKey(fmt::format(
        "Please add a '{}' section containing a 'provider' value and (if the provider requires it) a 'connection' section to {}'s config (available providers: {})",
        section, context.name, join(registry.provider_names())
      ));
    }
    const auto& map = section_value->get().as_mapping();
    const auto provider = config_get(map, "provider");
    if (!provider || !provider->get().is_string() || provider->get().as_string().empty()) {
      throw MissingProviderKey(fmt::format(
        "Please add a 'provider' value in the '{}' section of {}'s config (available providers: {})",
        section, context.name, join(registry.provider_names())
      ));
    }
    const auto connection = config_get(map, "connection");
    if (connection && !connection->get().is_mapping()) {
      throw ConfigError(fmt::format("'{}.connection' must be a mapping", section));
    }
    return {
      .provider = provider->get().as_string(),
      .connection = connection ? OptRef<ConfigMapping>(std::cref(connection->get().as_mapping())) : std::nullopt
    };
  }

  auto PluginDatabases::context() const -> shared_ptr<const PluginContext> {
    shared_ptr<const PluginContext> ctx = supplier ? supplier() : nullptr;
    if (!ctx) throw CallerResolutionFailed("Cannot determine which plugin is requesting a database");
    return ctx;
  }
}
