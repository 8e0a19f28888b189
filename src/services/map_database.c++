#include "map_database.h++"

using std::make_shared, std::optional, std::shared_lock, std::shared_mutex,
    std::shared_ptr, std::string, std::string_view, std::unique_lock, std::vector;

namespace Stowage {
  auto MapDatabase::check_open() const -> void {
    if (closed) throw StowageError("Map database is closed");
  }

  auto MapDatabase::get(string_view key) const -> optional<Value> {
    shared_lock<shared_mutex> l(lock);
    check_open();
    const auto it = entries.find(key);
    if (it == entries.end()) return {};
    return it->second;
  }

  auto MapDatabase::put(string_view key, Value value) -> void {
    unique_lock<shared_mutex> l(lock);
    check_open();
    entries.insert_or_assign(string(key), std::move(value));
  }

  auto MapDatabase::remove(string_view key) -> bool {
    unique_lock<shared_mutex> l(lock);
    check_open();
    const auto it = entries.find(key);
    if (it == entries.end()) return false;
    entries.erase(it);
    return true;
  }

  auto MapDatabase::contains(string_view key) const -> bool {
    shared_lock<shared_mutex> l(lock);
    check_open();
    return entries.contains(key);
  }

  auto MapDatabase::size() const -> size_t {
    shared_lock<shared_mutex> l(lock);
    check_open();
    return entries.size();
  }

  auto MapDatabase::keys() const -> vector<string> {
    shared_lock<shared_mutex> l(lock);
    check_open();
    vector<string> out;
    out.reserve(entries.size());
    for (const auto& [k, _] : entries) out.push_back(k);
    return out;
  }

  auto MapDatabase::clear() -> void {
    unique_lock<shared_mutex> l(lock);
    check_open();
    entries.clear();
  }

  auto MapDatabase::close() -> void {
    unique_lock<shared_mutex> l(lock);
    if (closed) return;
    closed = true;
    entries.clear();
  }

  auto MapProvider::get(OptRef<PluginContext>, OptRef<ConfigMapping>) -> shared_ptr<Database> {
    return make_shared<MapDatabase>();
  }
}
