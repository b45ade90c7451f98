#include "worker_pool.hpp"
#include <stdexcept>
#include <thread>

namespace dotsmith {

worker_pool::worker_pool(const config& cfg, std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)),
      m_thread_count(cfg.worker_threads > 0 ? cfg.worker_threads
                                            : std::thread::hardware_concurrency())
{
    if (m_thread_count == 0) m_thread_count = 1;
}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::start() {
    if (m_running.exchange(true)) return; // already started

    m_pool = std::make_unique<asio::thread_pool>(m_thread_count);
    m_log->debug("Worker pool started with {} threads", m_thread_count);
}

void worker_pool::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    m_pool->join();
    m_pool.reset();
    m_log->debug("Worker pool stopped");
}

asio::any_io_executor worker_pool::executor() const {
    if (!m_pool) throw std::logic_error("worker_pool: executor requested before start()");
    return m_pool->get_executor();
}

} // namespace dotsmith
