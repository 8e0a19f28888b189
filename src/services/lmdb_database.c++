#include "lmdb_database.h++"
#include "db/row_codec.h++"
#include <cstring>
#include <set>
#include <byteswap.h>
#include <unistd.h>

using std::function, std::make_shared, std::make_unique, std::set, std::shared_ptr,
    std::span, std::string, std::unique_ptr, std::vector;
namespace fs = std::filesystem;

namespace Stowage {
#  if __BIG_ENDIAN__
#    define swap_bytes(x) x
#  else
#    define swap_bytes(x) bswap_64(x)
#  endif

  struct LmdbDatabase::Txn {
    MDB_txn* txn = nullptr;
    bool committed = false;
    Txn(MDB_env* env, unsigned flags) {
      if (auto err = mdb_txn_begin(env, nullptr, flags, &txn)) {
        throw LmdbError("Failed to open transaction", err);
      }
    }
    ~Txn() {
      if (!committed) mdb_txn_abort(txn);
    }
    operator MDB_txn*() { return txn; }
    inline auto commit() -> void {
      // mdb_txn_commit frees the transaction even when it fails
      committed = true;
      if (auto err = mdb_txn_commit(txn)) throw LmdbError("Commit failed", err);
    }
  };

  struct MDBCursor {
    MDB_cursor* cur;
    MDBCursor(MDB_txn* txn, MDB_dbi dbi) {
      if (auto err = mdb_cursor_open(txn, dbi, &cur)) {
        throw LmdbError("Failed to open database cursor", err);
      }
    }
    ~MDBCursor() {
      mdb_cursor_close(cur);
    }
    operator MDB_cursor*() { return cur; }
  };

  class LmdbDatabase::QueryImpl : public TableQuery {
  private:
    LmdbDatabase& db;
    const Table& table;
    MDB_dbi dbi;
  public:
    QueryImpl(LmdbDatabase& db, const Table& table) : db(db), table(table), dbi(db.dbi(table)) {}

    auto select() -> vector<Row> {
      vector<Row> rows;
      db.read([&](MDB_txn* txn) {
        MDBCursor cur(txn, dbi);
        MDB_val k, v;
        for (int err = mdb_cursor_get(cur, &k, &v, MDB_FIRST); err != MDB_NOTFOUND; err = mdb_cursor_get(cur, &k, &v, MDB_NEXT)) {
          if (err) throw LmdbError(fmt::format("Failed to read table {}", table.name()), err);
          auto row = decode_row(span(static_cast<const uint8_t*>(v.mv_data), v.mv_size));
          table.check_row(row);
          rows.push_back(std::move(row));
        }
      });
      return rows;
    }

    auto insert(const Row& row) -> void {
      table.check_row(row);
      auto bytes = encode_row(row);
      db.write([&](MDB_txn* txn) {
        uint64_t next_id = 1;
        {
          MDBCursor cur(txn, dbi);
          MDB_val k, v;
          const int err = mdb_cursor_get(cur, &k, &v, MDB_LAST);
          if (!err) {
            uint64_t last;
            memcpy(&last, k.mv_data, sizeof(uint64_t));
            next_id = swap_bytes(last) + 1;
          } else if (err != MDB_NOTFOUND) {
            throw LmdbError(fmt::format("Failed to read table {}", table.name()), err);
          }
        }
        uint64_t key = swap_bytes(next_id);
        MDB_val kval { sizeof(uint64_t), &key }, vval { bytes.size(), bytes.data() };
        if (auto err = mdb_put(txn, dbi, &kval, &vval, MDB_APPEND)) {
          throw LmdbError(fmt::format("Insert into {} failed", table.name()), err);
        }
      });
    }

    auto count() -> size_t {
      size_t n = 0;
      db.read([&](MDB_txn* txn) {
        MDB_stat stat;
        if (auto err = mdb_stat(txn, dbi, &stat)) throw LmdbError(fmt::format("Failed to count {}", table.name()), err);
        n = stat.ms_entries;
      });
      return n;
    }

    auto clear() -> void {
      db.write([&](MDB_txn* txn) {
        if (auto err = mdb_drop(txn, dbi, 0)) throw LmdbError(fmt::format("Failed to clear {}", table.name()), err);
      });
    }
  };

  static auto page_aligned_map_size(size_t map_size_mb) -> size_t {
    if (map_size_mb > SIZE_MAX / MiB) {
      throw BackendConstructionError(fmt::format("LMDB map size of {:d} MiB is too large", map_size_mb));
    }
    const size_t bytes = map_size_mb * MiB;
    return bytes - bytes % (size_t)sysconf(_SC_PAGESIZE);
  }

  LmdbDatabase::LmdbDatabase(fs::path filename, vector<Table> tables, size_t map_size_mb)
    : RelationalDatabase(std::move(tables)), filename(std::move(filename)),
      map_size(page_aligned_map_size(map_size_mb)) {
    set<string> names;
    for (const auto& table : table_list) {
      if (!names.insert(table.name()).second) {
        throw BackendConstructionError(fmt::format(
          "Table name {} is used by more than one record type in {}", table.name(), this->filename.string()
        ));
      }
    }

    MDB_txn* init = nullptr;
    int err;
    if ((err = mdb_env_create(&env))) goto die;
    if ((err = mdb_env_set_maxdbs(env, (MDB_dbi)table_list.size() + 1))) goto die;
    if ((err = mdb_env_set_mapsize(env, map_size))) goto die;
    if ((err = mdb_env_open(env, this->filename.c_str(), MDB_NOSUBDIR | MDB_NOTLS, 0600))) goto die;
    if ((err = mdb_txn_begin(env, nullptr, 0, &init))) goto die;
    for (const auto& table : table_list) {
      MDB_dbi dbi;
      if ((err = mdb_dbi_open(init, table.name().c_str(), MDB_CREATE, &dbi))) goto die;
      dbis.emplace(table.type_name(), dbi);
    }
    err = mdb_txn_commit(init);
    init = nullptr;
    if (err) goto die;
    spdlog::debug("Opened LMDB database {} with {:d} tables", this->filename.string(), table_list.size());
    return;

  die:
    if (init != nullptr) mdb_txn_abort(init);
    if (env != nullptr) mdb_env_close(env);
    env = nullptr;
    throw BackendConstructionError(fmt::format(
      "Failed to open LMDB database {}: {}", this->filename.string(), mdb_strerror(err)
    ));
  }

  LmdbDatabase::~LmdbDatabase() {
    close();
  }

  auto LmdbDatabase::check_open() const -> void {
    if (env == nullptr) throw StowageError(fmt::format("LMDB database {} is closed", filename.string()));
  }

  auto LmdbDatabase::dbi(const Table& table) const -> MDB_dbi {
    return dbis.at(require_table(table).type_name());
  }

  auto LmdbDatabase::write(function<void (MDB_txn*)> fn) -> void {
    check_open();
    if (txn != nullptr) {
      fn(txn);
      return;
    }
    Txn t(env, 0);
    fn(t);
    t.commit();
  }

  auto LmdbDatabase::read(function<void (MDB_txn*)> fn) const -> void {
    check_open();
    if (txn != nullptr) {
      fn(txn);
      return;
    }
    Txn t(env, MDB_RDONLY);
    fn(t);
  }

  auto LmdbDatabase::begin_transaction() -> void {
    check_open();
    if (txn != nullptr) throw TransactionError("A transaction is already open");
    if (auto err = mdb_txn_begin(env, nullptr, 0, &txn)) {
      txn = nullptr;
      throw TransactionError(fmt::format("Failed to begin transaction on {}: {}", filename.string(), mdb_strerror(err)));
    }
  }

  auto LmdbDatabase::commit_transaction() -> void {
    if (txn == nullptr) throw TransactionError("No transaction is open");
    auto* t = txn;
    txn = nullptr;
    if (auto err = mdb_txn_commit(t)) {
      throw TransactionError(fmt::format("Failed to commit transaction on {}: {}", filename.string(), mdb_strerror(err)));
    }
  }

  auto LmdbDatabase::rollback_transaction() -> void {
    if (txn == nullptr) throw TransactionError("No transaction is open");
    mdb_txn_abort(txn);
    txn = nullptr;
  }

  auto LmdbDatabase::query(const Table& table) -> unique_ptr<TableQuery> {
    check_open();
    return make_unique<QueryImpl>(*this, require_table(table));
  }

  auto LmdbDatabase::close() -> void {
    if (env == nullptr) return;
    if (txn != nullptr) {
      spdlog::warn("Closing LMDB database {} with an open transaction; rolling it back", filename.string());
      mdb_txn_abort(txn);
      txn = nullptr;
    }
    mdb_env_close(env);
    env = nullptr;
    spdlog::debug("Closed LMDB database {}", filename.string());
  }

  auto LmdbProvider::get(OptRef<PluginContext> context, OptRef<ConfigMapping> connection) -> shared_ptr<Database> {
    const auto cfg = LmdbConfig::from(connection);
    auto tables = scan_tables(context, cfg.scan);
    const auto file = context ? context->get().resolve_path(cfg.file) : cfg.file;
    if (file.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(file.parent_path(), ec);
      if (ec) {
        throw BackendConstructionError(fmt::format("Cannot create directory for {}: {}", file.string(), ec.message()));
      }
    }
    return make_shared<LmdbDatabase>(file, std::move(tables), cfg.map_size_mb);
  }
}
