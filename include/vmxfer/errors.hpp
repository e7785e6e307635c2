#ifndef VMXFER_ERRORS_HPP
#define VMXFER_ERRORS_HPP

#include <string>

#include <spdlog/spdlog.h>

#include <vmxfer/export.hpp>
#include <vmxfer/enums.hpp>

namespace vmxfer
{
    // Explicit retry marking set at the point where an error is detected.
    // kAUTO leaves the decision to the retry policy's text classification.
    enum class Retry
    {
        kAUTO,
        kRETRYABLE,
        kNON_RETRYABLE,
    };

    struct TransferError
    {
        ErrorLevel level;
        ErrorCode code;
        std::string reason;
        Retry retry = Retry::kAUTO;

        bool is_serious() const noexcept
        {
            return (level == ErrorLevel::SERIOUS || level == ErrorLevel::FATAL);
        }

        bool is_fatal() const noexcept
        {
            return level == ErrorLevel::FATAL;
        }

        bool is_cancelled() const noexcept
        {
            return code == ErrorCode::XF_CANCELLED;
        }

        void log() const
        {
            switch (level)
            {
                case ErrorLevel::FATAL:
                    spdlog::critical(reason);
                    break;
                case ErrorLevel::SERIOUS:
                    spdlog::error(reason);
                    break;
                default:
                    spdlog::warn(reason);
            }
        }
    };

    inline TransferError non_retryable(TransferError error)
    {
        error.retry = Retry::kNON_RETRYABLE;
        return error;
    }

    inline TransferError retryable(TransferError error)
    {
        error.retry = Retry::kRETRYABLE;
        return error;
    }

    inline TransferError cancelled_error(const std::string& what)
    {
        return TransferError{
            ErrorLevel::INFO, ErrorCode::XF_CANCELLED, what + ": cancelled", Retry::kNON_RETRYABLE
        };
    }

    VMXFER_API const char* to_string(ErrorCode code) noexcept;
}

#endif
