#pragma once
#include "services/provider_registry.h++"
#include <libpq-fe.h>

namespace Stowage {
  class PostgresError : public StowageError {
  public:
    PostgresError(std::string message, const PGconn* conn) :
      StowageError(message + ": " + std::string(conn ? PQerrorMessage(conn) : "no connection")) {}
  };

  class PostgresDatabase : public RelationalDatabase {
  private:
    PGconn* conn = nullptr;
    bool transaction_open = false;

    class QueryImpl;
    using Result = std::unique_ptr<PGresult, void(*)(PGresult*)>;

    auto check_open() const -> void;
    auto exec(const std::string& sql, std::string_view what) -> Result;
    auto exec_params(const std::string& sql, const std::vector<std::optional<std::string>>& params, std::string_view what) -> Result;
    auto quote_identifier(std::string_view identifier) const -> std::string;
    auto create_table(const Table& table) -> void;
  public:
    PostgresDatabase(const std::string& conninfo, std::vector<Table> tables);
    PostgresDatabase(const PostgresDatabase&) = delete;
    auto operator=(const PostgresDatabase&) = delete;
    ~PostgresDatabase();

    auto begin_transaction() -> void;
    auto commit_transaction() -> void;
    auto rollback_transaction() -> void;
    auto in_transaction() const noexcept -> bool { return transaction_open; }
    auto query(const Table& table) -> std::unique_ptr<TableQuery>;
    auto close() -> void;
  };

  // Connection keys: conninfo, or host/port/database/user/password; plus
  // autoscan/package/tables
  class PostgresProvider : public Provider {
  public:
    auto get(OptRef<PluginContext> context, OptRef<ConfigMapping> connection) -> std::shared_ptr<Database>;
  };
}
