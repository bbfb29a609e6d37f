#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace logship {
/**
 * @brief A single-slot, re-armable timer.
 * @details At most one expiry is pending at a time. Arming replaces any
 * pending expiry. The expiry callback is called on the timer's own thread,
 * without the timer's lock held, so it may call back into the timer.
 */
class FlushTimer
{
  public:
    using Callback = std::function<void()>;

    explicit FlushTimer(Callback&& on_expire);
    ~FlushTimer() noexcept;

    /**
     * @brief Schedule the expiry callback @p delay from now, replacing any
     * pending expiry.
     */
    void arm(std::chrono::milliseconds delay);

    /** @brief Cancel the pending expiry, if any. */
    void cancel();

    [[nodiscard]] bool is_armed() const;

    /**
     * @brief Cancel any pending expiry and join the timer thread.
     * @note After calling this function, arm() has no effect.
     */
    void stop() noexcept;

  private:
    using Clock = std::chrono::steady_clock;

    Callback on_expire_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Clock::time_point> deadline_;
    uint64_t generation_{ 0 };
    bool stopped_{ false };

    std::thread thread_;

    void run_();
};
} // namespace logship
