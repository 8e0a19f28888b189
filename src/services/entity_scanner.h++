#pragma once
#include "models/type_catalog.h++"
#include <filesystem>

namespace Stowage {
  // A root from which record type names can be enumerated, e.g. the type
  // manifest shipped with a plugin.
  class CodeSource {
  public:
    virtual ~CodeSource() = default;
    // Every type name reachable from this root, in discovery order. The same
    // name may appear more than once. Throws ScanIOFailure if the root cannot
    // be read.
    virtual auto type_names() const -> std::vector<std::string> = 0;
  };

  class StaticCodeSource : public CodeSource {
  private:
    std::vector<std::string> names;
  public:
    StaticCodeSource(std::vector<std::string> names) : names(std::move(names)) {}
    auto type_names() const -> std::vector<std::string> { return names; }
  };

  // Reads a manifest file: one qualified type name per line, blank lines and
  // '#' comments ignored, and `@include other.manifest` to read another
  // manifest relative to this one.
  class ManifestCodeSource : public CodeSource {
  private:
    std::filesystem::path path;
  public:
    ManifestCodeSource(std::filesystem::path path) : path(std::move(path)) {}
    auto type_names() const -> std::vector<std::string>;
  };

  class EntityScanner {
  private:
    const TypeCatalog& types;
  public:
    EntityScanner(const TypeCatalog& types) : types(types) {}

    auto autoscan(const CodeSource& source, std::optional<std::string_view> package = {}) const -> std::vector<Table>;
    auto resolve(const std::vector<std::string>& names) const -> std::vector<Table>;
  };

  struct PluginContext;

  auto scan_tables(OptRef<PluginContext> context, const ScanConfig& config) -> std::vector<Table>;
}
