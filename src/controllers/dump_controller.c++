#include "dump_controller.h++"

using std::atomic, std::exception, std::make_shared, std::nullopt, std::packaged_task,
    std::shared_ptr, std::string, std::vector;

namespace Stowage {

static auto rollback_quietly(RelationalDatabase& db, std::string_view side) -> void {
  if (!db.in_transaction()) return;
  try {
    db.rollback_transaction();
  } catch (const exception& e) {
    spdlog::warn("Rollback of {} database failed: {}", side, e.what());
  }
}

auto DumpController::check_compatible(const RelationalDatabase& from, const RelationalDatabase& to) -> void {
  vector<string> missing;
  for (const auto& table : from.tables()) {
    if (!to.has_table(table)) missing.push_back(table.type_name());
  }
  if (!missing.empty()) throw IncompatibleSchemas(std::move(missing));
}

auto DumpController::dump(
  RelationalDatabase& from,
  RelationalDatabase& to,
  ProgressCallback on_progress,
  DumpOptions options
) -> void {
  check_compatible(from, to);
  const auto emit = [&](OptRef<Table> table, size_t remaining) {
    if (on_progress) on_progress(table, remaining);
  };

  try {
    from.begin_transaction();
  } catch (const exception& e) {
    throw TransactionStartFailed(fmt::format("Failed to begin transaction on source database: {}", e.what()));
  }
  try {
    to.begin_transaction();
  } catch (const exception& e) {
    rollback_quietly(from, "source");
    throw TransactionStartFailed(fmt::format("Failed to begin transaction on destination database: {}", e.what()));
  }

  spdlog::info("Dumping {:d} tables", from.tables().size());
  try {
    for (const auto& table : from.tables()) {
      const auto rows = from.query(table)->select();
      const auto total = rows.size();
      spdlog::info("Dumping table {} ({:d} rows)", table.name(), total);
      emit(std::cref(table), total);
      auto dest = to.query(table);
      size_t inserted = 0;
      bool ended = total == 0;
      for (const auto& row : rows) {
        dest->insert(row);
        inserted++;
        if (inserted % PROGRESS_BATCH == 0) {
          emit(std::cref(table), total - inserted);
          ended = inserted == total;
        }
      }
      if (options.always_emit_table_end && !ended) emit(std::cref(table), 0);
    }
  } catch (...) {
    rollback_quietly(to, "destination");
    rollback_quietly(from, "source");
    throw;
  }

  try {
    to.commit_transaction();
  } catch (const exception& e) {
    rollback_quietly(from, "source");
    throw TransactionCommitFailed(fmt::format("Failed to commit destination database: {}", e.what()));
  }
  try {
    from.commit_transaction();
  } catch (const exception& e) {
    // The destination is already committed; nothing left to undo there
    throw TransactionCommitFailed(fmt::format("Failed to commit source database: {}", e.what()));
  }

  spdlog::info("Dump complete");
  emit(nullopt, 0);
}

auto DumpController::dump_async(
  asio::any_io_executor executor,
  shared_ptr<RelationalDatabase> from,
  shared_ptr<RelationalDatabase> to,
  ProgressCallback on_progress,
  DumpOptions options
) -> DumpTask {
  if (!from || !to) throw StowageError("Cannot dump a null database");
  check_compatible(*from, *to);
  auto cancelled = make_shared<atomic<bool>>(false);
  auto task = make_shared<packaged_task<void ()>>(
    [from, to, on_progress = std::move(on_progress), options, cancelled] {
      if (cancelled->load(std::memory_order_acquire)) throw DumpCancelled();
      dump(*from, *to, on_progress, options);
    }
  );
  DumpTask result(task->get_future().share(), cancelled);
  asio::post(executor, [task] { (*task)(); });
  return result;
}

}
