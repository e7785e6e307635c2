#include <algorithm>

#include <spdlog/spdlog.h>

#include <vmxfer/rate_limiter.hpp>
#include <vmxfer/utils.hpp>

namespace vmxfer
{
    std::size_t RateLimiter::auto_burst(std::size_t bytes_per_second) noexcept
    {
        return std::max(bytes_per_second / 10, min_auto_burst);
    }

    RateLimiter::RateLimiter(std::size_t bytes_per_second, std::size_t burst)
        : m_rate(bytes_per_second)
        , m_burst(burst == 0 ? auto_burst(bytes_per_second) : burst)
        , m_auto_burst(burst == 0)
        , m_last_refill(clock::now())
        , m_start(m_last_refill)
    {
        // start with a full bucket
        m_tokens = static_cast<double>(m_burst);
        if (bytes_per_second != 0)
        {
            spdlog::info("Bandwidth limiter created: {}/s, burst {}",
                         format_bytes(bytes_per_second),
                         format_bytes(m_burst));
        }
    }

    void RateLimiter::refill(clock::time_point now)
    {
        std::chrono::duration<double> elapsed = now - m_last_refill;
        if (elapsed.count() <= 0)
            return;
        double rate = static_cast<double>(m_rate.load(std::memory_order_relaxed));
        m_tokens = std::min(static_cast<double>(m_burst), m_tokens + rate * elapsed.count());
        m_last_refill = now;
    }

    tl::expected<void, TransferError> RateLimiter::wait_n(std::size_t n,
                                                          const CancellationToken& token)
    {
        if (!enabled())
            return {};

        std::size_t remaining = n;
        while (remaining > 0)
        {
            if (token.cancelled())
                return tl::make_unexpected(cancelled_error("rate limiter wait"));

            std::chrono::duration<double> wait{ 0 };
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                refill(clock::now());

                const std::size_t slice = std::min(remaining, m_burst);
                if (m_tokens >= static_cast<double>(slice))
                {
                    m_tokens -= static_cast<double>(slice);
                    m_bytes_transferred += slice;
                    remaining -= slice;
                    continue;
                }

                const double rate = static_cast<double>(m_rate.load(std::memory_order_relaxed));
                if (rate <= 0)
                {
                    // limiting was switched off while waiting
                    m_bytes_transferred += remaining;
                    return {};
                }
                wait = std::chrono::duration<double>((static_cast<double>(slice) - m_tokens) / rate);
            }

            auto sleep = std::min(std::chrono::duration_cast<clock::duration>(wait),
                                  std::chrono::duration_cast<clock::duration>(max_wait));
            sleep = std::max(sleep, clock::duration(std::chrono::microseconds(100)));
            if (token.wait_for(sleep))
                return tl::make_unexpected(cancelled_error("rate limiter wait"));
        }
        return {};
    }

    std::size_t RateLimiter::burst() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_burst;
    }

    double RateLimiter::available() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tokens;
    }

    void RateLimiter::set_rate(std::size_t bytes_per_second)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        refill(clock::now());
        m_rate.store(bytes_per_second, std::memory_order_relaxed);
        if (m_auto_burst)
        {
            m_burst = auto_burst(bytes_per_second);
            m_tokens = std::min(m_tokens, static_cast<double>(m_burst));
        }
    }

    RateLimiterStats RateLimiter::stats() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        RateLimiterStats s;
        s.bytes_transferred = m_bytes_transferred;
        s.duration = clock::now() - m_start;
        double seconds = std::chrono::duration<double>(s.duration).count();
        if (seconds > 0)
            s.average_speed = static_cast<double>(m_bytes_transferred) / seconds;
        s.limit_speed = static_cast<double>(m_rate.load(std::memory_order_relaxed));
        return s;
    }

    namespace
    {
        AdaptiveRateConfig normalize(AdaptiveRateConfig config)
        {
            if (config.min_rate == 0)
                config.min_rate = 1024 * 1024;
            if (config.max_rate == 0)
                config.max_rate = 100 * 1024 * 1024;
            if (config.max_rate < config.min_rate)
                std::swap(config.min_rate, config.max_rate);
            if (config.increase_step == 0)
                config.increase_step = std::max<std::size_t>(config.max_rate / 20, 1);
            if (config.success_window == 0)
                config.success_window = 1;
            if (config.decrease_factor <= 0 || config.decrease_factor >= 1)
                config.decrease_factor = 0.8;
            return config;
        }
    }

    AdaptiveRateLimiter::AdaptiveRateLimiter(AdaptiveRateConfig config, std::size_t burst)
        : RateLimiter((normalize(config).min_rate + normalize(config).max_rate) / 2, burst)
        , m_config(normalize(config))
    {
    }

    void AdaptiveRateLimiter::apply(std::size_t new_rate)
    {
        new_rate = std::clamp(new_rate, m_config.min_rate, m_config.max_rate);
        const std::size_t old_rate = rate();
        if (new_rate == old_rate)
            return;
        set_rate(new_rate);
        spdlog::info("Bandwidth adjusted: {}/s -> {}/s", format_bytes(old_rate), format_bytes(new_rate));
    }

    void AdaptiveRateLimiter::record_success()
    {
        std::lock_guard<std::mutex> lock(m_adjust_mutex);
        if (++m_successes < m_config.success_window)
            return;
        m_successes = 0;
        apply(rate() + m_config.increase_step);
    }

    void AdaptiveRateLimiter::record_error()
    {
        std::lock_guard<std::mutex> lock(m_adjust_mutex);
        m_successes = 0;
        apply(static_cast<std::size_t>(static_cast<double>(rate()) * m_config.decrease_factor));
    }
}
