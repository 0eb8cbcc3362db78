#include "reminder/core/CancellationToken.hpp"

#include <QDeadlineTimer>
#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include <algorithm>
#include <vector>

namespace reminder {
namespace core {

struct CancellationToken::State
{
    mutable QMutex mutex;
    QWaitCondition condition;
    bool cancelled = false;
    std::vector<std::weak_ptr<State>> children;
};

CancellationToken::CancellationToken()
    : m_state(std::make_shared<State>())
{
}

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : m_state(std::move(state))
{
}

CancellationToken CancellationToken::createChild() const
{
    auto child = std::make_shared<State>();
    QMutexLocker locker(&m_state->mutex);
    if (m_state->cancelled) {
        child->cancelled = true;
    } else {
        auto &children = m_state->children;
        children.erase(std::remove_if(children.begin(), children.end(),
                                      [](const std::weak_ptr<State> &entry) { return entry.expired(); }),
                       children.end());
        children.push_back(child);
    }
    return CancellationToken(std::move(child));
}

void CancellationToken::cancel()
{
    std::vector<std::weak_ptr<State>> children;
    {
        QMutexLocker locker(&m_state->mutex);
        if (m_state->cancelled) {
            return;
        }
        m_state->cancelled = true;
        children.swap(m_state->children);
        m_state->condition.wakeAll();
    }
    for (const auto &entry : children) {
        if (auto child = entry.lock()) {
            CancellationToken(std::move(child)).cancel();
        }
    }
}

bool CancellationToken::isCancelled() const
{
    QMutexLocker locker(&m_state->mutex);
    return m_state->cancelled;
}

bool CancellationToken::waitFor(int timeoutMs) const
{
    QMutexLocker locker(&m_state->mutex);
    QDeadlineTimer deadline(std::max(timeoutMs, 0));
    while (!m_state->cancelled) {
        if (!m_state->condition.wait(&m_state->mutex, deadline)) {
            break;
        }
    }
    return m_state->cancelled;
}

} // namespace core
} // namespace reminder
