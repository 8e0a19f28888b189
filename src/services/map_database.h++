#pragma once
#include "services/provider_registry.h++"
#include <shared_mutex>

namespace Stowage {
  class MapDatabase : public KeyValueDatabase {
  private:
    mutable std::shared_mutex lock;
    std::map<std::string, Value, std::less<>> entries;
    bool closed = false;
    auto check_open() const -> void;
  public:
    MapDatabase() = default;
    ~MapDatabase() { close(); }

    auto get(std::string_view key) const -> std::optional<Value>;
    auto put(std::string_view key, Value value) -> void;
    auto remove(std::string_view key) -> bool;
    auto contains(std::string_view key) const -> bool;
    auto size() const -> size_t;
    auto keys() const -> std::vector<std::string>;
    auto clear() -> void;
    auto close() -> void;
  };

  // Schema-less; needs neither a context nor a connection section
  class MapProvider : public Provider {
  public:
    auto get(OptRef<PluginContext> context, OptRef<ConfigMapping> connection) -> std::shared_ptr<Database>;
  };
}
