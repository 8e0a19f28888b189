#pragma once
#include "util/common.h++"
#include <thread>
#include <asio.hpp>

namespace Stowage {
  class AsioThreadPool {
  public:
    std::shared_ptr<asio::io_context> io;
  private:
    std::vector<std::thread> threads;
    asio::executor_work_guard<asio::io_context::executor_type> work;
    bool done = false;
  public:
    AsioThreadPool(size_t thread_count = std::thread::hardware_concurrency())
      : io(std::make_shared<asio::io_context>()), work(io->get_executor())
    {
      threads.reserve(thread_count);
      for (size_t i = 0; i < thread_count; i++) {
        threads.emplace_back([io = io]() { io->run(); });
      }
    }
    AsioThreadPool(const AsioThreadPool&) = delete;
    auto operator=(const AsioThreadPool&) = delete;
    ~AsioThreadPool() { stop(); }
    auto stop() -> void {
      if (done) return;
      done = true;
      work.reset();
      io->stop();
      for (auto& th : threads) if (th.joinable()) th.join();
    }
    // Lets queued work finish before the threads exit
    auto drain() -> void {
      if (done) return;
      done = true;
      work.reset();
      for (auto& th : threads) if (th.joinable()) th.join();
    }
    auto executor() -> asio::io_context::executor_type {
      return io->get_executor();
    }
    auto post(std::move_only_function<void()>&& task) -> void {
      asio::post(*io, std::move(task));
    }
  };
}
