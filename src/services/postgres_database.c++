#include "postgres_database.h++"
#include <charconv>
#include <set>

using std::make_shared, std::make_unique, std::optional, std::set, std::shared_ptr,
    std::string, std::string_view, std::unique_ptr, std::vector;

namespace Stowage {
  static auto sql_type(ColumnType type) -> string_view {
    switch (type) {
      case ColumnType::Integer: return "BIGINT";
      case ColumnType::Real: return "DOUBLE PRECISION";
      case ColumnType::Text: return "TEXT";
      case ColumnType::Boolean: return "BOOLEAN";
    }
    return "TEXT";
  }

  static auto to_param(const Value& value) -> optional<string> {
    return std::visit(overload{
      [](std::monostate) -> optional<string> { return {}; },
      [](int64_t i) -> optional<string> { return fmt::format("{:d}", i); },
      [](double d) -> optional<string> { return fmt::format("{}", d); },
      [](bool b) -> optional<string> { return b ? "true" : "false"; },
      [](const string& s) -> optional<string> { return s; }
    }, value);
  }

  static auto parse_value(const Column& column, string_view text) -> Value {
    switch (column.type) {
      case ColumnType::Integer: {
        int64_t i;
        const auto res = std::from_chars(text.data(), text.data() + text.size(), i);
        if (res.ec != std::errc{} || res.ptr != text.data() + text.size()) {
          throw RowShapeError(fmt::format("Column {} returned a non-integer value: {}", column.name, text));
        }
        return i;
      }
      case ColumnType::Real:
        try {
          return std::stod(string(text));
        } catch (const std::logic_error&) {
          throw RowShapeError(fmt::format("Column {} returned a non-numeric value: {}", column.name, text));
        }
      case ColumnType::Boolean:
        if (text == "t" || text == "true") return true;
        if (text == "f" || text == "false") return false;
        throw RowShapeError(fmt::format("Column {} returned a non-boolean value: {}", column.name, text));
      case ColumnType::Text:
        break;
    }
    return string(text);
  }

  class PostgresDatabase::QueryImpl : public TableQuery {
  private:
    PostgresDatabase& db;
    const Table& table;
    string table_ident;
  public:
    QueryImpl(PostgresDatabase& db, const Table& table)
      : db(db), table(table), table_ident(db.quote_identifier(table.name())) {}

    auto select() -> vector<Row> {
      const auto& columns = table.columns();
      string sql = "SELECT ";
      for (size_t i = 0; i < columns.size(); i++) {
        if (i) sql += ", ";
        sql += db.quote_identifier(columns[i].name);
      }
      sql += " FROM " + table_ident;
      if (auto pk = table.primary_key_index()) sql += " ORDER BY " + db.quote_identifier(columns[*pk].name);
      const auto res = db.exec(sql, fmt::format("select from {}", table.name()));
      const int n = PQntuples(res.get());
      if (PQnfields(res.get()) != (int)columns.size()) {
        throw RowShapeError(fmt::format("Table {} returned {:d} columns, expected {:d}", table.name(), PQnfields(res.get()), columns.size()));
      }
      vector<Row> rows;
      rows.reserve((size_t)n);
      for (int r = 0; r < n; r++) {
        Row row;
        row.reserve(columns.size());
        for (size_t c = 0; c < columns.size(); c++) {
          if (PQgetisnull(res.get(), r, (int)c)) row.emplace_back(std::monostate{});
          else row.push_back(parse_value(columns[c], PQgetvalue(res.get(), r, (int)c)));
        }
        table.check_row(row);
        rows.push_back(std::move(row));
      }
      return rows;
    }

    auto insert(const Row& row) -> void {
      table.check_row(row);
      const auto& columns = table.columns();
      string names, placeholders;
      vector<optional<string>> params;
      params.reserve(row.size());
      for (size_t i = 0; i < columns.size(); i++) {
        if (i) { names += ", "; placeholders += ", "; }
        names += db.quote_identifier(columns[i].name);
        placeholders += fmt::format("${:d}", i + 1);
        params.push_back(to_param(row[i]));
      }
      db.exec_params(
        columns.empty()
          ? fmt::format("INSERT INTO {} DEFAULT VALUES", table_ident)
          : fmt::format("INSERT INTO {} ({}) VALUES ({})", table_ident, names, placeholders),
        params,
        fmt::format("insert into {}", table.name())
      );
    }

    auto count() -> size_t {
      const auto res = db.exec("SELECT COUNT(*) FROM " + table_ident, fmt::format("count {}", table.name()));
      return (size_t)std::stoull(PQgetvalue(res.get(), 0, 0));
    }

    auto clear() -> void {
      db.exec("DELETE FROM " + table_ident, fmt::format("clear {}", table.name()));
    }
  };

  PostgresDatabase::PostgresDatabase(const string& conninfo, vector<Table> tables)
    : RelationalDatabase(std::move(tables)) {
    set<string> names;
    for (const auto& table : table_list) {
      if (!names.insert(table.name()).second) {
        throw BackendConstructionError(fmt::format("Table name {} is used by more than one record type", table.name()));
      }
    }
    conn = PQconnectdb(conninfo.c_str());
    if (conn == nullptr || PQstatus(conn) != CONNECTION_OK) {
      const string message = conn ? PQerrorMessage(conn) : "out of memory";
      if (conn) PQfinish(conn);
      conn = nullptr;
      throw BackendConstructionError(fmt::format("Failed to connect to PostgreSQL: {}", message));
    }
    try {
      for (const auto& table : table_list) create_table(table);
    } catch (const PostgresError& e) {
      PQfinish(conn);
      conn = nullptr;
      throw BackendConstructionError(e.what());
    }
    spdlog::debug("Connected to PostgreSQL database {} with {:d} tables", PQdb(conn), table_list.size());
  }

  PostgresDatabase::~PostgresDatabase() {
    close();
  }

  auto PostgresDatabase::check_open() const -> void {
    if (conn == nullptr) throw StowageError("PostgreSQL connection is closed");
  }

  auto PostgresDatabase::exec(const string& sql, string_view what) -> Result {
    check_open();
    Result res(PQexec(conn, sql.c_str()), PQclear);
    const auto status = PQresultStatus(res.get());
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
      throw PostgresError(fmt::format("Failed to {}", what), conn);
    }
    return res;
  }

  auto PostgresDatabase::exec_params(const string& sql, const vector<optional<string>>& params, string_view what) -> Result {
    check_open();
    vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) values.push_back(p ? p->c_str() : nullptr);
    Result res(PQexecParams(conn, sql.c_str(), (int)values.size(), nullptr, values.data(), nullptr, nullptr, 0), PQclear);
    const auto status = PQresultStatus(res.get());
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
      throw PostgresError(fmt::format("Failed to {}", what), conn);
    }
    return res;
  }

  auto PostgresDatabase::quote_identifier(string_view identifier) const -> string {
    check_open();
    char* escaped = PQescapeIdentifier(conn, identifier.data(), identifier.size());
    if (escaped == nullptr) throw PostgresError(fmt::format("Invalid identifier {}", identifier), conn);
    string out(escaped);
    PQfreemem(escaped);
    return out;
  }

  auto PostgresDatabase::create_table(const Table& table) -> void {
    string sql = fmt::format("CREATE TABLE IF NOT EXISTS {} (", quote_identifier(table.name()));
    bool first = true;
    for (const auto& column : table.columns()) {
      if (!first) sql += ", ";
      first = false;
      sql += fmt::format("{} {}", quote_identifier(column.name), sql_type(column.type));
      if (column.primary_key) sql += " PRIMARY KEY";
      else if (!column.nullable) sql += " NOT NULL";
    }
    sql += ")";
    exec(sql, fmt::format("create table {}", table.name()));
  }

  auto PostgresDatabase::begin_transaction() -> void {
    check_open();
    if (transaction_open) throw TransactionError("A transaction is already open");
    try {
      exec("BEGIN", "begin transaction");
    } catch (const PostgresError& e) {
      throw TransactionError(e.what());
    }
    transaction_open = true;
  }

  auto PostgresDatabase::commit_transaction() -> void {
    if (!transaction_open) throw TransactionError("No transaction is open");
    // A failed COMMIT ends the transaction too
    transaction_open = false;
    Result res(nullptr, PQclear);
    try {
      res = exec("COMMIT", "commit transaction");
    } catch (const PostgresError& e) {
      throw TransactionError(e.what());
    }
    // COMMIT of an aborted transaction succeeds with the tag ROLLBACK
    if (string_view(PQcmdStatus(res.get())) == "ROLLBACK") {
      throw TransactionError("Transaction was aborted by an earlier error and has been rolled back");
    }
  }

  auto PostgresDatabase::rollback_transaction() -> void {
    if (!transaction_open) throw TransactionError("No transaction is open");
    transaction_open = false;
    try {
      exec("ROLLBACK", "roll back transaction");
    } catch (const PostgresError& e) {
      throw TransactionError(e.what());
    }
  }

  auto PostgresDatabase::query(const Table& table) -> unique_ptr<TableQuery> {
    check_open();
    return make_unique<QueryImpl>(*this, require_table(table));
  }

  auto PostgresDatabase::close() -> void {
    if (conn == nullptr) return;
    if (transaction_open) {
      spdlog::warn("Closing PostgreSQL connection with an open transaction; rolling it back");
      Result res(PQexec(conn, "ROLLBACK"), PQclear);
      if (PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        spdlog::warn("Rollback on close failed: {}", PQerrorMessage(conn));
      }
      transaction_open = false;
    }
    PQfinish(conn);
    conn = nullptr;
    spdlog::debug("Closed PostgreSQL connection");
  }

  auto PostgresProvider::get(OptRef<PluginContext> context, OptRef<ConfigMapping> connection) -> shared_ptr<Database> {
    const auto cfg = PostgresConfig::from(connection);
    auto tables = scan_tables(context, cfg.scan);
    return make_shared<PostgresDatabase>(cfg.connection_string(), std::move(tables));
  }
}
