#include <algorithm>
#include <array>
#include <cmath>
#include <random>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <vmxfer/retry.hpp>
#include <vmxfer/utils.hpp>

namespace vmxfer
{
    namespace
    {
        constexpr std::array<std::string_view, 11> network_errors = {
            "connection refused", "connection reset", "connection timeout",
            "network unreachable", "no such host",    "temporary failure",
            "timeout",            "TLS handshake timeout", "i/o timeout",
            "broken pipe",        "EOF",
        };

        constexpr std::array<std::string_view, 10> http_errors = {
            "500 Internal Server Error",
            "502 Bad Gateway",
            "503 Service Unavailable",
            "504 Gateway Timeout",
            "429 Too Many Requests",
            "RequestTimeout",
            "ServiceUnavailable",
            "InternalError",
            "SlowDown",
            "ThrottlingException",
        };

        constexpr std::array<std::string_view, 4> provider_errors = {
            "RequestLimitExceeded",
            "ProvisionedThroughputExceededException",
            "TransactionInProgressException",
            "TooManyRequests",
        };

        // libcurl's own wording for transport failures
        constexpr std::array<std::string_view, 7> curl_errors = {
            "couldn't resolve", "couldn't connect", "failed to connect", "timed out",
            "recv failure",     "send failure",     "partial file",
        };

        template <std::size_t N>
        bool matches_any(std::string_view message, const std::array<std::string_view, N>& patterns)
        {
            return std::any_of(patterns.begin(),
                               patterns.end(),
                               [&](std::string_view p) { return contains_ignore_case(message, p); });
        }

        double random_unit()
        {
            thread_local std::mt19937 generator{ std::random_device{}() };
            std::uniform_real_distribution<double> distribution(0.0, 1.0);
            return distribution(generator);
        }
    }

    RetryPolicy::RetryPolicy(RetryConfig config)
        : m_config(std::move(config))
    {
        if (m_config.max_attempts == 0)
            m_config.max_attempts = 3;
        if (m_config.initial_delay.count() <= 0)
            m_config.initial_delay = std::chrono::seconds(1);
        if (m_config.max_delay.count() <= 0)
            m_config.max_delay = std::chrono::seconds(30);
        if (m_config.multiplier <= 0)
            m_config.multiplier = 2.0;
    }

    std::chrono::milliseconds RetryPolicy::compute_delay(std::size_t attempt) const
    {
        if (attempt == 0)
            attempt = 1;
        double delay = static_cast<double>(m_config.initial_delay.count())
                       * std::pow(m_config.multiplier, static_cast<double>(attempt - 1));
        delay = std::min(delay, static_cast<double>(m_config.max_delay.count()));
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
    }

    std::chrono::milliseconds RetryPolicy::apply_jitter(std::chrono::milliseconds delay) const
    {
        if (!m_config.jitter)
            return delay;
        double extra = static_cast<double>(delay.count()) * jitter_factor * random_unit();
        return delay + std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(extra));
    }

    bool RetryPolicy::is_transient_message(std::string_view message)
    {
        return matches_any(message, network_errors) || matches_any(message, http_errors)
               || matches_any(message, provider_errors) || matches_any(message, curl_errors);
    }

    bool RetryPolicy::is_retryable(const TransferError& error) const
    {
        if (error.is_cancelled())
            return false;
        switch (error.retry)
        {
            case Retry::kRETRYABLE:
                return true;
            case Retry::kNON_RETRYABLE:
                return false;
            default:
                return is_transient_message(error.reason);
        }
    }

    tl::expected<void, TransferError> RetryPolicy::retry(const CancellationToken& token,
                                                         const operation_type& op,
                                                         const std::string& name) const
    {
        const std::size_t max_attempts = m_config.max_attempts;
        for (std::size_t attempt = 1; attempt <= max_attempts; ++attempt)
        {
            if (token.cancelled())
                return tl::make_unexpected(cancelled_error(name));

            auto res = op(attempt);
            if (res)
            {
                if (attempt > 1)
                {
                    spdlog::info("{} succeeded after retry (attempt {}/{})", name, attempt, max_attempts);
                }
                return res;
            }

            TransferError error = std::move(res.error());
            if (error.is_cancelled())
                return tl::make_unexpected(std::move(error));

            if (!is_retryable(error))
            {
                spdlog::warn("{} failed with non-retryable error (attempt {}): {}",
                             name,
                             attempt,
                             error.reason);
                error.reason
                    = fmt::format("{} (attempt {}/{}): {}", name, attempt, max_attempts, error.reason);
                error.retry = Retry::kNON_RETRYABLE;
                return tl::make_unexpected(std::move(error));
            }

            if (attempt >= max_attempts)
            {
                spdlog::error("{} failed after {} attempts: {}", name, max_attempts, error.reason);
                return tl::make_unexpected(TransferError{
                    ErrorLevel::SERIOUS,
                    ErrorCode::XF_RETRIES_EXHAUSTED,
                    fmt::format("{} failed after {} attempts: {}", name, max_attempts, error.reason),
                    Retry::kNON_RETRYABLE });
            }

            auto delay = apply_jitter(compute_delay(attempt));
            spdlog::warn("{} failed, retrying in {} ms (attempt {}/{}): {}",
                         name,
                         delay.count(),
                         attempt,
                         max_attempts,
                         error.reason);
            if (m_on_retry)
                m_on_retry(attempt, error, delay);

            if (token.wait_for(delay))
                return tl::make_unexpected(cancelled_error(name));
        }
        // max_attempts >= 1, the loop always returns
        return tl::make_unexpected(TransferError{
            ErrorLevel::SERIOUS, ErrorCode::XF_UNKNOWNERROR, name + ": no attempt made" });
    }
}
