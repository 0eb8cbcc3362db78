#pragma once

#include <QDateTime>
#include <QUuid>

#include "reminder/core/CancellationToken.hpp"

namespace reminder {
namespace data {
class ReminderStore;
struct Reminder;
}

namespace scheduling {

class NotificationQueue;

// Watches one schedule revision of one reminder until it fires or is
// cancelled. run() blocks the calling thread.
class ReminderMonitor
{
public:
    enum class Outcome
    {
        Fired,
        Cancelled,
        Faulted,
    };

    ReminderMonitor(data::ReminderStore &store, NotificationQueue &queue, const data::Reminder &reminder,
                    core::CancellationToken token, int pollIntervalMs);

    Outcome run();

    const QUuid &reminderId() const;
    quint64 revision() const;

private:
    Outcome watch();

    data::ReminderStore &m_store;
    NotificationQueue &m_queue;
    QUuid m_id;
    QDateTime m_triggerTime;
    quint64 m_revision = 0;
    core::CancellationToken m_token;
    int m_pollIntervalMs = 1000;
};

QString outcomeName(ReminderMonitor::Outcome outcome);

} // namespace scheduling
} // namespace reminder
