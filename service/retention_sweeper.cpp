#include "retention_sweeper.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

retention_sweeper::retention_sweeper(std::filesystem::path storage_dir,
                                     std::chrono::seconds retention,
                                     std::chrono::seconds interval)
    : m_storage_dir(std::move(storage_dir)),
      m_retention(retention),
      m_interval(interval),
      m_stop_requested(false)
{
}

retention_sweeper::~retention_sweeper()
{
    stop();
}

void retention_sweeper::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_thread.joinable()) {
        return;
    }
    m_stop_requested = false;
    m_thread = std::thread(&retention_sweeper::run, this);
    spdlog::info("Retention sweeper started dir={} retention={}s interval={}s",
                 m_storage_dir.string(), m_retention.count(), m_interval.count());
}

void retention_sweeper::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_thread.joinable()) {
            return;
        }
        m_stop_requested = true;
    }
    m_cv.notify_all();
    m_thread.join();
    spdlog::info("Retention sweeper stopped");
}

bool retention_sweeper::is_running() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_thread.joinable() && !m_stop_requested;
}

std::size_t retention_sweeper::sweep_once() const
{
    return sweep_once(std::filesystem::file_time_type::clock::now());
}

std::size_t retention_sweeper::sweep_once(std::filesystem::file_time_type now) const
{
    const auto cutoff = now - m_retention;
    std::size_t deleted = 0;

    for (const auto& entry : std::filesystem::directory_iterator(m_storage_dir)) {
        std::error_code ec;
        if (!entry.is_regular_file(ec) || ec) {
            continue;
        }

        const auto modified = entry.last_write_time(ec);
        if (ec) {
            spdlog::warn("Failed to stat old image path={} error={}", entry.path().string(), ec.message());
            continue;
        }
        if (modified >= cutoff) {
            continue;
        }

        if (std::filesystem::remove(entry.path(), ec)) {
            ++deleted;
        } else if (ec) {
            spdlog::warn("Failed to delete old image path={} error={}", entry.path().string(), ec.message());
        }
    }

    if (deleted > 0) {
        spdlog::info("Camera cleanup removed {} old images", deleted);
    }
    return deleted;
}

void retention_sweeper::run()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stop_requested) {
        lock.unlock();
        try {
            std::filesystem::create_directories(m_storage_dir);
            sweep_once();
        } catch (const std::exception& e) {
            spdlog::error("Camera cleanup loop error: {}", e.what());
        }
        lock.lock();

        m_cv.wait_for(lock, m_interval, [this] { return m_stop_requested; });
    }
}
