#ifndef VMXFER_CANCELLATION_HPP
#define VMXFER_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <vmxfer/export.hpp>

namespace vmxfer
{
    // Shared cancellation flag. Copies refer to the same state; `child()` derives a token that
    // follows its parent but can be cancelled on its own.
    class VMXFER_API CancellationToken
    {
    public:
        using clock = std::chrono::steady_clock;

        CancellationToken();

        void cancel();
        bool cancelled() const noexcept;

        // Returns true if the token was (or became) cancelled while waiting.
        bool wait_for(clock::duration duration) const;

        CancellationToken child() const;
        CancellationToken with_timeout(clock::duration timeout) const;

        std::optional<clock::time_point> deadline() const noexcept;

    private:
        struct State
        {
            std::atomic<bool> flag{ false };
            std::optional<clock::time_point> deadline;
            mutable std::mutex mutex;
            mutable std::condition_variable cv;
            std::vector<std::weak_ptr<State>> children;
        };

        explicit CancellationToken(std::shared_ptr<State> state);
        CancellationToken derive(std::optional<clock::time_point> deadline) const;
        static void cancel_state(const std::shared_ptr<State>& state);

        std::shared_ptr<State> m_state;
    };
}

#endif
