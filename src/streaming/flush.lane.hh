#pragma once

#include <condition_variable>
#include <cstddef> // size_t
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace logship {
/**
 * @brief A queue of jobs run one at a time, in order, on a dedicated thread.
 * @details At most one job is in flight at any time, so jobs never race each
 * other over shared state.
 */
class FlushLane
{
  public:
    using Job = std::function<bool(std::string&)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    // The error handler `err` is called on the lane's thread when a job
    // returns false or throws, with the job's diagnostic message.
    explicit FlushLane(ErrorCallback&& err);
    ~FlushLane() noexcept;

    /**
     * @brief Queue a job behind any jobs already queued.
     * @return False if the lane has been stopped.
     */
    [[nodiscard]] bool push_job(Job&& job);

    /// @brief The number of jobs queued and not yet started.
    [[nodiscard]] size_t pending_jobs() const;

    /**
     * @brief Drop the jobs that have not started.
     * @return The number of jobs dropped.
     */
    size_t cancel_pending();

    /// @brief True if called from inside a job or the error handler.
    [[nodiscard]] bool is_worker_thread() const;

    /**
     * @brief Run every queued job, then join the lane's thread.
     * @note After calling this function, the lane no longer accepts jobs.
     * Called from the lane's own thread, it stops accepting jobs but does not
     * wait.
     */
    void await_stop() noexcept;

  private:
    ErrorCallback error_handler_;

    mutable std::mutex jobs_mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool is_accepting_jobs_{ true };

    std::thread worker_;

    std::optional<Job> pop_job_();
    void run_();
};
} // namespace logship
