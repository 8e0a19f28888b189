#pragma once
#include "services/entity_scanner.h++"
#include "util/config.h++"

namespace Stowage {
  // Identity of the component asking for a database: where its files live,
  // its configuration root, and the types it can load.
  struct PluginContext {
    std::string name;
    std::filesystem::path data_dir = ".";
    ConfigValue config;
    std::shared_ptr<const CodeSource> code_source;
    // Falls back to TypeCatalog::global() when null
    std::shared_ptr<const TypeCatalog> types;

    auto type_catalog() const -> const TypeCatalog& {
      return types ? *types : TypeCatalog::global();
    }
    auto resolve_path(const std::filesystem::path& p) const -> std::filesystem::path {
      return p.is_absolute() ? p : data_dir / p;
    }
  };
}
