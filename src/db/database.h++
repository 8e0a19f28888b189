#pragma once
#include "models/table.h++"
#include <memory>

namespace Stowage {
  class Database {
  public:
    virtual ~Database() = default;
    // Releases the underlying connection. Safe to call more than once;
    // destructors call it too.
    virtual auto close() -> void = 0;
  };

  // Schema-less handle: string keys to single values
  class KeyValueDatabase : public Database {
  public:
    virtual auto get(std::string_view key) const -> std::optional<Value> = 0;
    virtual auto put(std::string_view key, Value value) -> void = 0;
    virtual auto remove(std::string_view key) -> bool = 0;
    virtual auto contains(std::string_view key) const -> bool = 0;
    virtual auto size() const -> size_t = 0;
    virtual auto keys() const -> std::vector<std::string> = 0;
    virtual auto clear() -> void = 0;
  };

  class TableQuery {
  public:
    virtual ~TableQuery() = default;
    virtual auto select() -> std::vector<Row> = 0;
    virtual auto insert(const Row& row) -> void = 0;
    virtual auto count() -> size_t = 0;
    virtual auto clear() -> void = 0;
  };

  class RelationalDatabase : public Database {
  protected:
    std::vector<Table> table_list;

    RelationalDatabase(std::vector<Table> tables) : table_list(std::move(tables)) {}

    // Throws UnknownTable if this handle does not manage the table
    auto require_table(const Table& table) const -> const Table& {
      const auto it = std::find(table_list.begin(), table_list.end(), table);
      if (it == table_list.end()) throw UnknownTable(table.type_name(), "is not managed by this database");
      return *it;
    }
  public:
    auto tables() const noexcept -> const std::vector<Table>& { return table_list; }
    auto has_table(const Table& table) const noexcept -> bool {
      return std::find(table_list.begin(), table_list.end(), table) != table_list.end();
    }

    // At most one transaction may be open; outside of one, every query
    // operation commits on its own.
    virtual auto begin_transaction() -> void = 0;
    virtual auto commit_transaction() -> void = 0;
    virtual auto rollback_transaction() -> void = 0;
    virtual auto in_transaction() const noexcept -> bool = 0;

    virtual auto query(const Table& table) -> std::unique_ptr<TableQuery> = 0;
  };

  template <typename T> class Query {
  private:
    std::unique_ptr<TableQuery> q;
  public:
    Query(RelationalDatabase& db) : q(db.query(RecordTraits<T>::table())) {}

    auto select() -> std::vector<T> {
      std::vector<T> out;
      for (const auto& row : q->select()) out.push_back(RecordTraits<T>::from_row(row));
      return out;
    }
    auto insert(const T& record) -> void { q->insert(RecordTraits<T>::to_row(record)); }
    auto count() -> size_t { return q->count(); }
    auto clear() -> void { q->clear(); }
  };

  template <typename T> static inline auto query(RelationalDatabase& db) -> Query<T> {
    return Query<T>(db);
  }
}
