#pragma once
#include "services/provider_registry.h++"
#include <filesystem>
#include <unordered_map>
#include <lmdb.h>

namespace Stowage {
  class LmdbError : public StowageError {
  public:
    int mdb_error;
    LmdbError(std::string message, int mdb_error) :
      StowageError(message + ": " + std::string(mdb_strerror(mdb_error))), mdb_error(mdb_error) {}
  };

  // One LMDB environment per handle; each table is a named sub-database whose
  // keys are big-endian row ids, so cursor order is insertion order.
  class LmdbDatabase : public RelationalDatabase {
  private:
    std::filesystem::path filename;
    size_t map_size;
    MDB_env* env = nullptr;
    MDB_txn* txn = nullptr;
    std::unordered_map<std::string, MDB_dbi> dbis;

    struct Txn;
    class QueryImpl;

    auto check_open() const -> void;
    auto dbi(const Table& table) const -> MDB_dbi;
    auto write(std::function<void (MDB_txn*)> fn) -> void;
    auto read(std::function<void (MDB_txn*)> fn) const -> void;
  public:
    LmdbDatabase(std::filesystem::path filename, std::vector<Table> tables, size_t map_size_mb = 1024);
    LmdbDatabase(const LmdbDatabase&) = delete;
    auto operator=(const LmdbDatabase&) = delete;
    ~LmdbDatabase();

    auto path() const noexcept -> const std::filesystem::path& { return filename; }

    auto begin_transaction() -> void;
    auto commit_transaction() -> void;
    auto rollback_transaction() -> void;
    auto in_transaction() const noexcept -> bool { return txn != nullptr; }
    auto query(const Table& table) -> std::unique_ptr<TableQuery>;
    auto close() -> void;
  };

  // Connection keys: file (relative to the plugin's data dir), map_size_mb,
  // plus autoscan/package/tables
  class LmdbProvider : public Provider {
  public:
    auto get(OptRef<PluginContext> context, OptRef<ConfigMapping> connection) -> std::shared_ptr<Database>;
  };
}
