#ifndef VMXFER_RATE_LIMITER_HPP
#define VMXFER_RATE_LIMITER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>

#include <tl/expected.hpp>

#include <vmxfer/cancellation.hpp>
#include <vmxfer/errors.hpp>
#include <vmxfer/export.hpp>

namespace vmxfer
{
    struct RateLimiterStats
    {
        std::size_t bytes_transferred = 0;
        std::chrono::steady_clock::duration duration{};
        // bytes per second
        double average_speed = 0.0;
        double limit_speed = 0.0;
    };

    // Token bucket. Tokens are bytes, refilled continuously at `rate` bytes per second up to
    // `burst`, recomputed lazily under the lock on every request. A rate of 0 disables limiting.
    class VMXFER_API RateLimiter
    {
    public:
        using clock = std::chrono::steady_clock;

        static constexpr std::size_t min_auto_burst = 64 * 1024;
        static constexpr std::chrono::milliseconds max_wait{ 1000 };

        // burst == 0 selects max(rate / 10, 64 KiB)
        explicit RateLimiter(std::size_t bytes_per_second, std::size_t burst = 0);
        virtual ~RateLimiter() = default;

        RateLimiter(const RateLimiter&) = delete;
        RateLimiter& operator=(const RateLimiter&) = delete;

        bool enabled() const noexcept
        {
            return m_rate.load(std::memory_order_relaxed) != 0;
        }

        // Blocks until `n` tokens have been taken. Requests larger than the burst are served
        // in burst-sized slices. Fails only if `token` is cancelled.
        tl::expected<void, TransferError> wait_n(std::size_t n, const CancellationToken& token);

        std::size_t rate() const noexcept
        {
            return m_rate.load(std::memory_order_relaxed);
        }

        std::size_t burst() const;
        double available() const;
        void set_rate(std::size_t bytes_per_second);

        RateLimiterStats stats() const;

        // Feedback hooks, no-ops for a fixed rate limiter.
        virtual void record_success()
        {
        }
        virtual void record_error()
        {
        }

        static std::size_t auto_burst(std::size_t bytes_per_second) noexcept;

    private:
        void refill(clock::time_point now);

        std::atomic<std::size_t> m_rate;
        std::size_t m_burst;
        bool m_auto_burst;
        double m_tokens;
        clock::time_point m_last_refill;
        clock::time_point m_start;
        std::size_t m_bytes_transferred = 0;
        mutable std::mutex m_mutex;
    };

    struct AdaptiveRateConfig
    {
        std::size_t min_rate = 1024 * 1024;
        std::size_t max_rate = 100 * 1024 * 1024;
        // consecutive successes needed before the rate is raised
        std::size_t success_window = 3;
        // additive increase, 0 selects max_rate / 20
        std::size_t increase_step = 0;
        double decrease_factor = 0.8;
    };

    // AIMD variant: sustained success nudges the rate up by a fixed step, an error cuts it
    // multiplicatively. The rate always stays within [min_rate, max_rate] and starts halfway.
    class VMXFER_API AdaptiveRateLimiter : public RateLimiter
    {
    public:
        explicit AdaptiveRateLimiter(AdaptiveRateConfig config, std::size_t burst = 0);

        void record_success() override;
        void record_error() override;

        const AdaptiveRateConfig& config() const noexcept
        {
            return m_config;
        }

    private:
        void apply(std::size_t new_rate);

        AdaptiveRateConfig m_config;
        std::size_t m_successes = 0;
        std::mutex m_adjust_mutex;
    };
}

#endif
