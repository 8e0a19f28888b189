#include "util/common.h++"
#include "db/database.h++"
#include "services/plugin_context.h++"
#include "services/provider_registry.h++"
#include <cstdio>
#include <map>
#include <filesystem>
#include <fstream>
#include <catch2/catch_test_macros.hpp>
#include <static_block.hpp>

using std::make_shared, std::make_unique, std::nullopt, std::optional,
    std::pair, std::runtime_error, std::shared_ptr, std::string,
    std::string_view, std::vector;
using namespace std::chrono_literals;
using namespace std::literals::string_view_literals;
using namespace Stowage;

struct TestUser {
  int64_t id;
  string name;
  optional<string> email;
};

struct TestLog {
  int64_t id;
  string message;
};

struct TestAudit {
  int64_t id;
  bool ok;
  double score;
};

namespace Stowage {
  template <> struct RecordTraits<TestUser> {
    static auto table() -> const Table& {
      static const Table t("test.User", "users", {
        { .name = "id", .type = ColumnType::Integer, .primary_key = true },
        { .name = "name", .type = ColumnType::Text, .nullable = false },
        { .name = "email", .type = ColumnType::Text }
      });
      return t;
    }
    static auto to_row(const TestUser& u) -> Row {
      return { u.id, u.name, u.email ? Value(*u.email) : Value() };
    }
    static auto from_row(const Row& row) -> TestUser {
      return { row_get<int64_t>(row, 0), row_get<string>(row, 1), row_get_opt<string>(row, 2) };
    }
  };

  template <> struct RecordTraits<TestLog> {
    static auto table() -> const Table& {
      static const Table t("test.Log", "logs", {
        { .name = "id", .type = ColumnType::Integer, .primary_key = true },
        { .name = "message", .type = ColumnType::Text, .nullable = false }
      });
      return t;
    }
    static auto to_row(const TestLog& l) -> Row { return { l.id, l.message }; }
    static auto from_row(const Row& row) -> TestLog {
      return { row_get<int64_t>(row, 0), row_get<string>(row, 1) };
    }
  };

  template <> struct RecordTraits<TestAudit> {
    static auto table() -> const Table& {
      static const Table t("test.Audit", "audit", {
        { .name = "id", .type = ColumnType::Integer, .primary_key = true },
        { .name = "ok", .type = ColumnType::Boolean, .nullable = false },
        { .name = "score", .type = ColumnType::Real }
      });
      return t;
    }
    static auto to_row(const TestAudit& a) -> Row { return { a.id, a.ok, a.score }; }
    static auto from_row(const Row& row) -> TestAudit {
      return { row_get<int64_t>(row, 0), row_get<bool>(row, 1), row_get<double>(row, 2) };
    }
  };
}

static inline auto users_table() -> const Table& { return RecordTraits<TestUser>::table(); }
static inline auto logs_table() -> const Table& { return RecordTraits<TestLog>::table(); }
static inline auto audit_table() -> const Table& { return RecordTraits<TestAudit>::table(); }

static inline auto user_row(int64_t i) -> Row {
  return { i, fmt::format("user{:d}", i), Value() };
}

static_block {
  spdlog::set_level(spdlog::level::debug);
  auto& types = TypeCatalog::global();
  types.add_record<TestUser>();
  types.add_record<TestLog>();
  types.add_record<TestAudit>();
  types.add({ "test.Helper", nullopt });
}

static inline auto write_file(const std::filesystem::path& p, string_view contents) -> void {
  std::ofstream out(p, std::ios::binary);
  out << contents;
  REQUIRE(out.good());
}

struct TempFile {
  char* name;

  TempFile() {
    name = std::tmpnam(nullptr);
  }
  ~TempFile() {
    std::remove(name);
    std::remove(fmt::format("{}-lock", name).c_str());
  }
};

struct TempDir {
  std::filesystem::path path;

  TempDir() : path(std::tmpnam(nullptr)) {
    std::filesystem::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

// Restores the registry's providers when the test ends
struct RegistryGuard {
  ProviderRegistry& registry;
  ProviderRegistry::Snapshot saved;

  RegistryGuard(ProviderRegistry& registry = ProviderRegistry::global())
    : registry(registry), saved(registry.snapshot()) {}
  ~RegistryGuard() {
    registry.restore(std::move(saved));
  }
};

// In-memory relational database that records every call and fails on demand
class FakeRelationalDatabase : public RelationalDatabase {
private:
  std::map<string, vector<Row>> committed, staged;
  bool open_txn = false;
  size_t inserts = 0;

  auto rows(const Table& table) -> vector<Row>& {
    return (open_txn ? staged : committed)[table.type_name()];
  }

  class FakeQuery : public TableQuery {
  private:
    FakeRelationalDatabase& db;
    const Table& table;
  public:
    FakeQuery(FakeRelationalDatabase& db, const Table& table) : db(db), table(table) {}

    auto select() -> vector<Row> {
      db.calls.push_back("select:" + table.name());
      return db.rows(table);
    }
    auto insert(const Row& row) -> void {
      db.calls.push_back("insert:" + table.name());
      db.inserts++;
      if (db.fail_on_insert && db.inserts == *db.fail_on_insert) {
        throw RowShapeError(fmt::format("Injected failure on insert {:d}", db.inserts));
      }
      table.check_row(row);
      db.rows(table).push_back(row);
    }
    auto count() -> size_t { return db.rows(table).size(); }
    auto clear() -> void { db.rows(table).clear(); }
  };
public:
  vector<string> calls;
  bool fail_begin = false, fail_commit = false, fail_rollback = false;
  // 1-based, counted across all tables of this handle
  optional<size_t> fail_on_insert;
  bool closed = false;

  FakeRelationalDatabase(vector<Table> tables) : RelationalDatabase(std::move(tables)) {}

  auto begin_transaction() -> void {
    calls.push_back("begin");
    if (fail_begin) throw TransactionError("Injected begin failure");
    if (open_txn) throw TransactionError("A transaction is already open");
    staged = committed;
    open_txn = true;
  }
  auto commit_transaction() -> void {
    calls.push_back("commit");
    if (!open_txn) throw TransactionError("No transaction is open");
    open_txn = false;
    if (fail_commit) {
      staged.clear();
      throw TransactionError("Injected commit failure");
    }
    committed = std::move(staged);
    staged.clear();
  }
  auto rollback_transaction() -> void {
    calls.push_back("rollback");
    if (!open_txn) throw TransactionError("No transaction is open");
    open_txn = false;
    staged.clear();
    if (fail_rollback) throw TransactionError("Injected rollback failure");
  }
  auto in_transaction() const noexcept -> bool { return open_txn; }
  auto query(const Table& table) -> std::unique_ptr<TableQuery> {
    return make_unique<FakeQuery>(*this, require_table(table));
  }
  auto close() -> void {
    closed = true;
  }

  auto seed(const Table& table, size_t n) -> void {
    auto& r = committed[table.type_name()];
    for (size_t i = 1; i <= n; i++) {
      if (table == users_table()) r.push_back(user_row((int64_t)i));
      else if (table == logs_table()) r.push_back({ (int64_t)i, fmt::format("log {:d}", i) });
      else r.push_back({ (int64_t)i, i % 2 == 0, (double)i / 2.0 });
    }
  }
  auto committed_count(const Table& table) const -> size_t {
    const auto it = committed.find(table.type_name());
    return it == committed.end() ? 0 : it->second.size();
  }
  auto count_calls(string_view prefix) const -> size_t {
    return (size_t)std::count_if(calls.begin(), calls.end(), [&](const string& c) { return c.starts_with(prefix); });
  }
};
