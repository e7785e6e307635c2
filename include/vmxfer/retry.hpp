#ifndef VMXFER_RETRY_HPP
#define VMXFER_RETRY_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include <vmxfer/cancellation.hpp>
#include <vmxfer/errors.hpp>
#include <vmxfer/export.hpp>

namespace vmxfer
{
    struct RetryConfig
    {
        std::size_t max_attempts = 3;
        std::chrono::milliseconds initial_delay{ 1000 };
        std::chrono::milliseconds max_delay{ 30000 };
        double multiplier = 2.0;
        // Inflate every delay by up to 25% at random.
        bool jitter = true;
    };

    // Re-invokes a fallible operation with exponential backoff.
    //
    // An error explicitly marked retryable/non-retryable is honored as is. Otherwise the reason
    // text is matched against known transient signatures (network failures, 5xx/429 responses,
    // provider throttling); anything else fails on first occurrence. Cancelled errors are never
    // retried and the token is checked before every attempt and during every backoff sleep.
    class VMXFER_API RetryPolicy
    {
    public:
        using operation_type = std::function<tl::expected<void, TransferError>(std::size_t)>;
        // Called before sleeping, with the attempt that failed and the delay about to be waited.
        using retry_callback_type
            = std::function<void(std::size_t, const TransferError&, std::chrono::milliseconds)>;

        static constexpr double jitter_factor = 0.25;

        explicit RetryPolicy(RetryConfig config = {});

        const RetryConfig& config() const noexcept
        {
            return m_config;
        }

        void set_on_retry(retry_callback_type callback)
        {
            m_on_retry = std::move(callback);
        }

        // `op` receives the 1-based attempt number.
        tl::expected<void, TransferError> retry(const CancellationToken& token,
                                                const operation_type& op,
                                                const std::string& name) const;

        template <class T, class F>
        tl::expected<T, TransferError> retry_with_result(const CancellationToken& token,
                                                         F&& op,
                                                         const std::string& name) const
        {
            std::optional<T> value;
            auto res = retry(
                token,
                [&](std::size_t attempt) -> tl::expected<void, TransferError>
                {
                    tl::expected<T, TransferError> r = op(attempt);
                    if (!r)
                        return tl::make_unexpected(r.error());
                    value.emplace(std::move(r.value()));
                    return {};
                },
                name);
            if (!res)
                return tl::make_unexpected(res.error());
            return std::move(*value);
        }

        // Backoff before attempt `attempt + 1`, without jitter.
        std::chrono::milliseconds compute_delay(std::size_t attempt) const;
        std::chrono::milliseconds apply_jitter(std::chrono::milliseconds delay) const;

        bool is_retryable(const TransferError& error) const;
        static bool is_transient_message(std::string_view message);

    private:
        RetryConfig m_config;
        retry_callback_type m_on_retry;
    };
}

#endif
