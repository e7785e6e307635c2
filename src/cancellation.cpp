#include <algorithm>

#include <vmxfer/cancellation.hpp>

namespace vmxfer
{
    CancellationToken::CancellationToken()
        : m_state(std::make_shared<State>())
    {
    }

    CancellationToken::CancellationToken(std::shared_ptr<State> state)
        : m_state(std::move(state))
    {
    }

    void CancellationToken::cancel()
    {
        cancel_state(m_state);
    }

    void CancellationToken::cancel_state(const std::shared_ptr<State>& state)
    {
        std::vector<std::weak_ptr<State>> children;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->flag.exchange(true))
                return;
            children.swap(state->children);
        }
        state->cv.notify_all();

        for (auto& weak_child : children)
        {
            if (auto child = weak_child.lock())
            {
                cancel_state(child);
            }
        }
    }

    bool CancellationToken::cancelled() const noexcept
    {
        if (m_state->flag.load(std::memory_order_acquire))
            return true;
        return m_state->deadline && clock::now() >= *m_state->deadline;
    }

    bool CancellationToken::wait_for(clock::duration duration) const
    {
        auto until = clock::now() + duration;
        if (m_state->deadline && *m_state->deadline < until)
        {
            until = *m_state->deadline;
        }

        std::unique_lock<std::mutex> lock(m_state->mutex);
        m_state->cv.wait_until(lock, until, [this] { return m_state->flag.load(); });
        return cancelled();
    }

    CancellationToken CancellationToken::derive(std::optional<clock::time_point> deadline) const
    {
        auto state = std::make_shared<State>();
        state->deadline = m_state->deadline;
        if (deadline && (!state->deadline || *deadline < *state->deadline))
        {
            state->deadline = deadline;
        }

        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (m_state->flag.load())
            {
                state->flag = true;
            }
            else
            {
                // drop children that are already gone
                auto& children = m_state->children;
                children.erase(std::remove_if(children.begin(),
                                              children.end(),
                                              [](const std::weak_ptr<State>& w)
                                              { return w.expired(); }),
                               children.end());
                children.push_back(state);
            }
        }
        return CancellationToken(std::move(state));
    }

    CancellationToken CancellationToken::child() const
    {
        return derive(std::nullopt);
    }

    CancellationToken CancellationToken::with_timeout(clock::duration timeout) const
    {
        return derive(clock::now() + timeout);
    }

    std::optional<CancellationToken::clock::time_point> CancellationToken::deadline() const noexcept
    {
        return m_state->deadline;
    }
}
