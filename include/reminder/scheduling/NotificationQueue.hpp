#pragma once

#include <QMutex>
#include <QQueue>
#include <QWaitCondition>
#include <optional>

#include "reminder/data/Reminder.hpp"

namespace reminder {
namespace scheduling {

// Unbounded FIFO between the monitors (producers) and the dispatcher
// (single consumer).
class NotificationQueue
{
public:
    NotificationQueue();
    ~NotificationQueue();

    void push(data::NotificationEvent event);
    std::optional<data::NotificationEvent> pop(int timeoutMs);
    std::optional<data::NotificationEvent> tryPop();
    int size() const;

private:
    mutable QMutex m_mutex;
    QWaitCondition m_notEmpty;
    QQueue<data::NotificationEvent> m_events;
};

} // namespace scheduling
} // namespace reminder
