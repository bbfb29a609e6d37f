#include "flush.timer.hh"
#include "macros.hh"

logship::FlushTimer::FlushTimer(Callback&& on_expire)
  : on_expire_{ std::move(on_expire) }
{
    EXPECT(on_expire_, "Expiry callback must not be empty.");
    thread_ = std::thread([this] { run_(); });
}

logship::FlushTimer::~FlushTimer() noexcept
{
    stop();
}

void
logship::FlushTimer::arm(std::chrono::milliseconds delay)
{
    std::scoped_lock lock(mutex_);
    if (stopped_) {
        return;
    }

    deadline_ = Clock::now() + delay;
    ++generation_;
    cv_.notify_all();
}

void
logship::FlushTimer::cancel()
{
    std::scoped_lock lock(mutex_);
    if (deadline_) {
        deadline_.reset();
        ++generation_;
        cv_.notify_all();
    }
}

bool
logship::FlushTimer::is_armed() const
{
    std::scoped_lock lock(mutex_);
    return deadline_.has_value();
}

void
logship::FlushTimer::stop() noexcept
{
    {
        std::scoped_lock lock(mutex_);
        stopped_ = true;
        deadline_.reset();
        ++generation_;
        cv_.notify_all();
    }

    if (thread_.joinable()) {
        thread_.join();
    }
}

void
logship::FlushTimer::run_()
{
    std::unique_lock lock(mutex_);
    while (!stopped_) {
        if (!deadline_) {
            cv_.wait(lock, [this] { return stopped_ || deadline_.has_value(); });
            continue;
        }

        const auto generation = generation_;
        const auto deadline = *deadline_;
        cv_.wait_until(lock, deadline, [this, generation] {
            return stopped_ || generation_ != generation;
        });

        if (stopped_ || generation_ != generation) {
            continue; // cancelled or re-armed
        }

        deadline_.reset();
        lock.unlock();
        try {
            on_expire_();
        } catch (const std::exception& exc) {
            LOG_ERROR("Timer callback failed: ", exc.what());
        }
        lock.lock();
    }
}
