#include "reminder/scheduling/ReminderMonitor.hpp"

#include <QtGlobal>
#include <exception>

#include "reminder/core/Logging.hpp"
#include "reminder/data/Reminder.hpp"
#include "reminder/data/ReminderStore.hpp"
#include "reminder/scheduling/NotificationQueue.hpp"

namespace reminder {
namespace scheduling {

ReminderMonitor::ReminderMonitor(data::ReminderStore &store, NotificationQueue &queue,
                                 const data::Reminder &reminder, core::CancellationToken token,
                                 int pollIntervalMs)
    : m_store(store)
    , m_queue(queue)
    , m_id(reminder.id)
    , m_triggerTime(reminder.triggerTime)
    , m_revision(reminder.revision)
    , m_token(std::move(token))
    , m_pollIntervalMs(qMax(1, pollIntervalMs))
{
}

const QUuid &ReminderMonitor::reminderId() const
{
    return m_id;
}

quint64 ReminderMonitor::revision() const
{
    return m_revision;
}

ReminderMonitor::Outcome ReminderMonitor::run()
{
    qCDebug(lcMonitor) << "monitoring" << m_id << "due" << m_triggerTime;
    Outcome outcome = Outcome::Faulted;
    try {
        outcome = watch();
    } catch (const std::exception &ex) {
        qCWarning(lcMonitor) << "monitor for" << m_id << "failed:" << ex.what();
        outcome = Outcome::Faulted;
    }
    qCDebug(lcMonitor) << "monitor for" << m_id << "finished:" << outcomeName(outcome);
    return outcome;
}

ReminderMonitor::Outcome ReminderMonitor::watch()
{
    while (true) {
        if (m_token.isCancelled()) {
            return Outcome::Cancelled;
        }

        const auto current = m_store.get(m_id);
        if (!current || !current->active || current->revision != m_revision) {
            return Outcome::Cancelled;
        }

        const qint64 remainingMs = QDateTime::currentDateTime().msecsTo(m_triggerTime);
        if (remainingMs <= 0) {
            const auto claimed = m_store.claimFiring(m_id, m_revision, [this](const data::Reminder &reminder) {
                data::NotificationEvent event;
                event.title = reminder.title;
                event.description = reminder.description;
                event.firedAt = QDateTime::currentDateTime();
                m_queue.push(std::move(event));
            });
            if (!claimed) {
                return Outcome::Cancelled;
            }
            qCInfo(lcMonitor) << "reminder fired:" << claimed->title;
            return Outcome::Fired;
        }

        const int waitMs = static_cast<int>(qMin<qint64>(remainingMs, m_pollIntervalMs));
        if (m_token.waitFor(waitMs)) {
            return Outcome::Cancelled;
        }
    }
}

QString outcomeName(ReminderMonitor::Outcome outcome)
{
    switch (outcome) {
    case ReminderMonitor::Outcome::Fired:
        return QStringLiteral("fired");
    case ReminderMonitor::Outcome::Cancelled:
        return QStringLiteral("cancelled");
    case ReminderMonitor::Outcome::Faulted:
    default:
        return QStringLiteral("faulted");
    }
}

} // namespace scheduling
} // namespace reminder
