#include "test_common.h++"
#include "services/postgres_database.h++"
#include "controllers/dump_controller.h++"
#include "services/lmdb_database.h++"

// Set STOWAGE_TEST_POSTGRES to a libpq conninfo (e.g. "dbname=stowage_test")
// to run these against a scratch database; its tables are dropped first.
static auto test_conninfo() -> optional<string> {
  if (const char* s = std::getenv("STOWAGE_TEST_POSTGRES"); s && *s) return string(s);
  return {};
}

static auto reset(PostgresDatabase& db) -> void {
  for (const auto& table : db.tables()) db.query(table)->clear();
}

TEST_CASE("postgres connection failure", "[postgres]") {
  CHECK_THROWS_AS(
    PostgresDatabase("host=/nonexistent/socket/dir dbname=none connect_timeout=1", { users_table() }),
    BackendConstructionError
  );
}

TEST_CASE("postgres insert, select and transactions", "[postgres]") {
  const auto conninfo = test_conninfo();
  if (!conninfo) SKIP("STOWAGE_TEST_POSTGRES is not set");
  PostgresDatabase db(*conninfo, { users_table(), audit_table() });
  reset(db);

  auto users = query<TestUser>(db);
  users.insert({ 2, "b", nullopt });
  users.insert({ 1, "a", "a@example.com" });
  const auto all = users.select();
  REQUIRE(all.size() == 2);
  CHECK(all[0].id == 1);
  CHECK(all[0].email == "a@example.com");
  CHECK(!all[1].email);

  auto audit = query<TestAudit>(db);
  audit.insert({ 1, true, 0.25 });
  const auto a = audit.select();
  REQUIRE(a.size() == 1);
  CHECK(a[0].ok);
  CHECK(a[0].score == 0.25);

  db.begin_transaction();
  users.insert({ 3, "c", nullopt });
  CHECK(users.count() == 3);
  db.rollback_transaction();
  CHECK(users.count() == 2);

  db.begin_transaction();
  users.insert({ 3, "c", nullopt });
  db.commit_transaction();
  CHECK(users.count() == 3);

  CHECK_THROWS_AS(users.insert({ 3, "duplicate", nullopt }), PostgresError);
  CHECK_THROWS_AS(db.rollback_transaction(), TransactionError);
  db.close();
}

TEST_CASE("postgres commit after a failed statement", "[postgres]") {
  const auto conninfo = test_conninfo();
  if (!conninfo) SKIP("STOWAGE_TEST_POSTGRES is not set");
  PostgresDatabase db(*conninfo, { users_table() });
  reset(db);
  auto users = query<TestUser>(db);
  users.insert({ 1, "a", nullopt });

  db.begin_transaction();
  users.insert({ 2, "b", nullopt });
  CHECK_THROWS_AS(users.insert({ 1, "duplicate", nullopt }), PostgresError);
  CHECK_THROWS_AS(db.commit_transaction(), TransactionError);
  CHECK(!db.in_transaction());
  CHECK(users.count() == 1);
  db.close();
}

TEST_CASE("postgres table without columns", "[postgres]") {
  const auto conninfo = test_conninfo();
  if (!conninfo) SKIP("STOWAGE_TEST_POSTGRES is not set");
  const Table marker("test.Marker", "markers", {});
  PostgresDatabase db(*conninfo, { marker });
  reset(db);
  auto q = db.query(marker);
  q->insert({});
  q->insert({});
  CHECK(q->count() == 2);
  CHECK(q->select() == vector<Row>{ Row{}, Row{} });
  db.close();
}

TEST_CASE("dump from LMDB into postgres", "[postgres][dump]") {
  const auto conninfo = test_conninfo();
  if (!conninfo) SKIP("STOWAGE_TEST_POSTGRES is not set");
  TempFile file;
  auto from = make_shared<LmdbDatabase>(file.name, vector<Table>{ users_table() }, 16);
  auto to = make_shared<PostgresDatabase>(*conninfo, vector<Table>{ users_table(), audit_table() });
  reset(*to);
  auto q = from->query(users_table());
  for (int64_t i = 1; i <= 120; i++) q->insert(user_row(i));
  DumpController::dump(*from, *to);
  CHECK(to->query(users_table())->count() == 120);
  CHECK(to->query(users_table())->select() == q->select());
}
