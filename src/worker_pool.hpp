#pragma once

#include "config.hpp"
#include <asio/any_io_executor.hpp>
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>

namespace dotsmith {

// Owns the threads that traversal coroutines and blocking filesystem calls run on.
class worker_pool {
public:
    worker_pool(const config& cfg, std::shared_ptr<spdlog::logger> log);
    ~worker_pool();

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;

    // Spawn the threads. Must be called before executor().
    void start();

    // Wait for outstanding work to finish and join threads.
    void stop();

    // Executor of the running pool. Throws std::logic_error if not started.
    asio::any_io_executor executor() const;

    unsigned int thread_count() const { return m_thread_count; }

private:
    std::shared_ptr<spdlog::logger> m_log;

    unsigned int m_thread_count;
    std::atomic<bool> m_running{false};

    std::unique_ptr<asio::thread_pool> m_pool;
};

} // namespace dotsmith
