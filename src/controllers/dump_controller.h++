#pragma once
#include "db/database.h++"
#include <atomic>
#include <future>
#include <asio.hpp>

namespace Stowage {

// Called with {table, rows remaining} while copying, and {nullopt, 0} once
// everything is committed. Runs on the thread doing the copy.
using ProgressCallback = std::function<void (OptRef<Table>, size_t)>;

struct DumpOptions {
  // Also report {table, 0} after each table's last row when the batch
  // cadence did not land on it
  bool always_emit_table_end = false;
};

class DumpTask : public Cancelable {
private:
  std::shared_future<void> future;
  std::shared_ptr<std::atomic<bool>> cancelled;
public:
  DumpTask(std::shared_future<void> future, std::shared_ptr<std::atomic<bool>> cancelled)
    : future(std::move(future)), cancelled(std::move(cancelled)) {}

  auto wait() const -> void { future.wait(); }
  // Rethrows whatever the dump threw
  auto get() const -> void { future.get(); }
  auto is_done() const -> bool {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  }
  // Only takes effect if the dump has not started yet
  void cancel() noexcept override { cancelled->store(true, std::memory_order_release); }
};

class DumpController {
public:
  static constexpr size_t PROGRESS_BATCH = 100;

  // Throws IncompatibleSchemas if `to` lacks any of `from`'s tables
  static auto check_compatible(const RelationalDatabase& from, const RelationalDatabase& to) -> void;

  // Copies every row of every table in `from` into the same table in `to`,
  // inside one transaction on each side.
  static auto dump(
    RelationalDatabase& from,
    RelationalDatabase& to,
    ProgressCallback on_progress = nullptr,
    DumpOptions options = {}
  ) -> void;

  // Checks compatibility immediately, then runs dump() on `executor`.
  // Both handles must stay unused by anything else until the task is done.
  static auto dump_async(
    asio::any_io_executor executor,
    std::shared_ptr<RelationalDatabase> from,
    std::shared_ptr<RelationalDatabase> to,
    ProgressCallback on_progress = nullptr,
    DumpOptions options = {}
  ) -> DumpTask;
};

}
