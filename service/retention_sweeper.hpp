#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <thread>

/**
 * @brief Background deletion of expired image files
 *
 * Every interval the sweeper removes regular files directly inside the
 * storage directory whose modification time is older than the retention
 * window. Failures are logged; the loop keeps running until stop().
 */
class retention_sweeper {
public:
    retention_sweeper(std::filesystem::path storage_dir,
                      std::chrono::seconds retention,
                      std::chrono::seconds interval);

    /**
     * @brief Destructor, stops the background thread
     */
    ~retention_sweeper();

    retention_sweeper(const retention_sweeper&) = delete;
    retention_sweeper& operator=(const retention_sweeper&) = delete;

    /**
     * @brief Start the background thread, the first pass runs immediately
     */
    void start();

    /**
     * @brief Interrupt the wait between passes and join the thread
     *
     * A pass in progress is allowed to finish. Safe to call repeatedly.
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Run a single pass against the current time
     *
     * @return number of deleted files
     * @throws std::filesystem::filesystem_error if the directory cannot be listed
     */
    std::size_t sweep_once() const;

    /**
     * @brief Run a single pass with an explicit "now"
     */
    std::size_t sweep_once(std::filesystem::file_time_type now) const;

private:
    void run();

    std::filesystem::path m_storage_dir;
    std::chrono::seconds m_retention;
    std::chrono::seconds m_interval;

    std::thread m_thread;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stop_requested;
};
