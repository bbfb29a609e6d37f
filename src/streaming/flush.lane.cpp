#include "flush.lane.hh"
#include "logger.hh"

#include <exception>

logship::FlushLane::FlushLane(ErrorCallback&& err)
  : error_handler_{ std::move(err) }
{
    worker_ = std::thread([this] { run_(); });
}

logship::FlushLane::~FlushLane() noexcept
{
    if (const auto dropped = cancel_pending(); dropped > 0) {
        LOG_WARNING("Dropped ", dropped, " queued jobs.");
    }

    await_stop();
}

bool
logship::FlushLane::push_job(Job&& job)
{
    std::scoped_lock lock(jobs_mutex_);
    if (!is_accepting_jobs_) {
        return false;
    }

    jobs_.push_back(std::move(job));
    cv_.notify_one();

    return true;
}

size_t
logship::FlushLane::pending_jobs() const
{
    std::scoped_lock lock(jobs_mutex_);
    return jobs_.size();
}

size_t
logship::FlushLane::cancel_pending()
{
    std::scoped_lock lock(jobs_mutex_);
    const auto dropped = jobs_.size();
    jobs_.clear();

    return dropped;
}

bool
logship::FlushLane::is_worker_thread() const
{
    return std::this_thread::get_id() == worker_.get_id();
}

void
logship::FlushLane::await_stop() noexcept
{
    {
        std::scoped_lock lock(jobs_mutex_);
        is_accepting_jobs_ = false;
        cv_.notify_all();
    }

    if (is_worker_thread()) {
        LOG_ERROR("Cannot wait on the flush lane from its own thread.");
        return;
    }

    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<logship::FlushLane::Job>
logship::FlushLane::pop_job_()
{
    std::unique_lock lock(jobs_mutex_);
    cv_.wait(lock, [this] { return !is_accepting_jobs_ || !jobs_.empty(); });

    // drain the queue before stopping
    if (jobs_.empty()) {
        return std::nullopt;
    }

    auto job = std::move(jobs_.front());
    jobs_.pop_front();
    return job;
}

void
logship::FlushLane::run_()
{
    while (auto job = pop_job_()) {
        std::string err;
        bool ok = false;
        try {
            ok = (*job)(err);
        } catch (const std::exception& exc) {
            err = exc.what();
        }

        if (ok) {
            continue;
        }

        if (error_handler_) {
            error_handler_(err);
        } else {
            LOG_ERROR("Job failed: ", err);
        }
    }
}
