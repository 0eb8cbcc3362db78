#include "reminder/scheduling/NotificationQueue.hpp"

#include <QDeadlineTimer>
#include <QMutexLocker>
#include <QtGlobal>

namespace reminder {
namespace scheduling {

NotificationQueue::NotificationQueue() = default;
NotificationQueue::~NotificationQueue() = default;

void NotificationQueue::push(data::NotificationEvent event)
{
    QMutexLocker locker(&m_mutex);
    m_events.enqueue(std::move(event));
    m_notEmpty.wakeOne();
}

std::optional<data::NotificationEvent> NotificationQueue::pop(int timeoutMs)
{
    QMutexLocker locker(&m_mutex);
    QDeadlineTimer deadline(qMax(timeoutMs, 0));
    while (m_events.isEmpty()) {
        if (!m_notEmpty.wait(&m_mutex, deadline)) {
            break;
        }
    }
    if (m_events.isEmpty()) {
        return std::nullopt;
    }
    return m_events.dequeue();
}

std::optional<data::NotificationEvent> NotificationQueue::tryPop()
{
    QMutexLocker locker(&m_mutex);
    if (m_events.isEmpty()) {
        return std::nullopt;
    }
    return m_events.dequeue();
}

int NotificationQueue::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_events.size();
}

} // namespace scheduling
} // namespace reminder
