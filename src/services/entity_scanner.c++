#include "entity_scanner.h++"
#include "services/plugin_context.h++"
#include <fstream>
#include <set>

using std::optional, std::set, std::string, std::string_view, std::vector;
namespace fs = std::filesystem;

namespace Stowage {
  static inline auto trim(string_view s) -> string_view {
    const auto start = s.find_first_not_of(" \t\r");
    if (start == string_view::npos) return {};
    const auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
  }

  static auto read_manifest(const fs::path& path, set<fs::path>& visited, vector<string>& out) -> void {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    if (ec) canonical = path;
    if (!visited.insert(canonical).second) return;

    std::ifstream in(path);
    if (!in) throw ScanIOFailure(fmt::format("Cannot read type manifest {}", path.string()));
    string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
      line_no++;
      auto entry = trim(line);
      if (const auto hash = entry.find('#'); hash != string_view::npos) entry = trim(entry.substr(0, hash));
      if (entry.empty()) continue;
      if (entry.starts_with("@include")) {
        const auto target = trim(entry.substr(8));
        if (target.empty()) {
          throw ScanIOFailure(fmt::format("Malformed manifest {}:{:d}: @include without a file", path.string(), line_no));
        }
        read_manifest(path.parent_path() / fs::path(target), visited, out);
      } else if (is_qualified_name(entry)) {
        out.emplace_back(entry);
      } else {
        throw ScanIOFailure(fmt::format("Malformed manifest {}:{:d}: '{}' is not a type name", path.string(), line_no, entry));
      }
    }
    if (in.bad()) throw ScanIOFailure(fmt::format("Error reading type manifest {}", path.string()));
  }

  auto ManifestCodeSource::type_names() const -> vector<string> {
    vector<string> out;
    set<fs::path> visited;
    read_manifest(path, visited, out);
    return out;
  }

  auto EntityScanner::autoscan(const CodeSource& source, optional<string_view> package) const -> vector<Table> {
    vector<Table> tables;
    set<string, std::less<>> seen;
    size_t skipped = 0;
    for (const auto& name : source.type_names()) {
      if (package && !name.starts_with(*package)) continue;
      if (seen.contains(name)) continue;
      const auto type = types.load(name);
      if (!type) {
        spdlog::debug("Skipping type {}: cannot be loaded", name);
        skipped++;
        continue;
      }
      seen.insert(name);
      if (TypeCatalog::is_table(*type)) tables.push_back(*type->table);
    }
    spdlog::debug("Autoscan found {:d} tables ({:d} types skipped)", tables.size(), skipped);
    return tables;
  }

  auto EntityScanner::resolve(const vector<string>& names) const -> vector<Table> {
    vector<Table> tables;
    set<string, std::less<>> seen;
    for (const auto& name : names) {
      const auto type = types.load(name);
      if (!type) throw UnknownTable(name);
      if (!TypeCatalog::is_table(*type)) throw UnknownTable(name, "is not a table type");
      if (seen.insert(name).second) tables.push_back(*type->table);
    }
    return tables;
  }

  auto scan_tables(OptRef<PluginContext> context, const ScanConfig& config) -> vector<Table> {
    const auto& catalog = context ? context->get().type_catalog() : TypeCatalog::global();
    EntityScanner scanner(catalog);
    if (!config.autoscan) return scanner.resolve(config.tables);
    if (!context || !context->get().code_source) {
      throw ConfigError("'autoscan' requires a plugin context with a code source");
    }
    return scanner.autoscan(*context->get().code_source, config.package);
  }
}
