#include "reminder/scheduling/SchedulerSupervisor.hpp"

#include <QDeadlineTimer>
#include <QMutexLocker>
#include <QThread>
#include <algorithm>

#include "reminder/core/Logging.hpp"
#include "reminder/data/Reminder.hpp"

namespace reminder {
namespace scheduling {

SchedulerSupervisor::SchedulerSupervisor(data::ReminderStore &store, NotificationQueue &queue,
                                         core::CancellationToken shutdownToken, int pollIntervalMs)
    : m_store(store)
    , m_queue(queue)
    , m_shutdownToken(std::move(shutdownToken))
    , m_pollIntervalMs(pollIntervalMs)
{
}

SchedulerSupervisor::~SchedulerSupervisor()
{
    if (!shutdown(5000)) {
        // Monitor threads reference this object; they must be gone before it is.
        qCWarning(lcSupervisor) << "monitors still running at destruction, waiting";
        std::vector<std::shared_ptr<MonitorHandle>> remaining;
        {
            QMutexLocker locker(&m_mutex);
            remaining = m_retired;
            for (const auto &handle : m_monitors) {
                remaining.push_back(handle);
            }
        }
        for (const auto &handle : remaining) {
            handle->thread->wait();
        }
    }
}

void SchedulerSupervisor::setOutcomeObserver(OutcomeObserver observer)
{
    QMutexLocker locker(&m_mutex);
    m_observer = std::move(observer);
}

bool SchedulerSupervisor::spawn(const data::Reminder &reminder)
{
    reapFinished();
    if (!reminder.active) {
        qCDebug(lcSupervisor) << "not monitoring inactive reminder" << reminder.id;
        return false;
    }

    QMutexLocker locker(&m_mutex);
    if (m_shutDown || m_shutdownToken.isCancelled()) {
        qCDebug(lcSupervisor) << "refusing to monitor" << reminder.id << "after shutdown";
        return false;
    }
    if (m_monitors.contains(reminder.id)) {
        qCDebug(lcSupervisor) << "reminder" << reminder.id << "already has a monitor";
        return false;
    }

    auto handle = std::make_shared<MonitorHandle>();
    handle->serial = ++m_nextSerial;
    handle->token = m_shutdownToken.createChild();

    auto monitor = std::make_shared<ReminderMonitor>(m_store, m_queue, reminder, handle->token, m_pollIntervalMs);
    const QUuid id = reminder.id;
    const quint64 serial = handle->serial;
    handle->thread.reset(QThread::create([this, monitor, id, serial]() {
        const auto outcome = monitor->run();
        retire(id, serial, outcome);
    }));
    handle->thread->setObjectName(QStringLiteral("monitor-%1").arg(id.toString(QUuid::WithoutBraces).left(8)));

    m_monitors.insert(id, handle);
    handle->thread->start();
    qCDebug(lcSupervisor) << "spawned monitor" << serial << "for" << id;
    return true;
}

bool SchedulerSupervisor::cancel(const QUuid &id, int timeoutMs)
{
    std::shared_ptr<MonitorHandle> handle;
    {
        QMutexLocker locker(&m_mutex);
        handle = m_monitors.take(id);
    }
    reapFinished();
    if (!handle) {
        return false;
    }

    handle->token.cancel();
    if (!handle->thread->wait(QDeadlineTimer(std::max(timeoutMs, 0)))) {
        qCWarning(lcSupervisor) << "monitor for" << id << "did not stop within" << timeoutMs << "ms";
        QMutexLocker locker(&m_mutex);
        m_retired.push_back(handle);
    }
    qCDebug(lcSupervisor) << "cancelled monitor for" << id;
    return true;
}

bool SchedulerSupervisor::reschedule(const data::Reminder &reminder, int timeoutMs)
{
    cancel(reminder.id, timeoutMs);
    return spawn(reminder);
}

bool SchedulerSupervisor::isMonitoring(const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    return m_monitors.contains(id);
}

int SchedulerSupervisor::monitorCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_monitors.size();
}

bool SchedulerSupervisor::isShutDown() const
{
    QMutexLocker locker(&m_mutex);
    return m_shutDown;
}

bool SchedulerSupervisor::shutdown(int timeoutMs)
{
    std::vector<std::shared_ptr<MonitorHandle>> handles;
    {
        QMutexLocker locker(&m_mutex);
        m_shutDown = true;
        handles.swap(m_retired);
        for (const auto &handle : m_monitors) {
            handles.push_back(handle);
        }
        m_monitors.clear();
    }

    m_shutdownToken.cancel();
    for (const auto &handle : handles) {
        handle->token.cancel();
    }

    QDeadlineTimer deadline(std::max(timeoutMs, 0));
    bool allStopped = true;
    std::vector<std::shared_ptr<MonitorHandle>> stragglers;
    for (const auto &handle : handles) {
        if (!handle->thread->wait(deadline)) {
            allStopped = false;
            stragglers.push_back(handle);
        }
    }

    if (!stragglers.empty()) {
        qCWarning(lcSupervisor) << stragglers.size() << "monitors did not stop within" << timeoutMs << "ms";
        QMutexLocker locker(&m_mutex);
        m_retired.insert(m_retired.end(), stragglers.begin(), stragglers.end());
    } else {
        qCInfo(lcSupervisor) << "all monitors stopped";
    }
    return allStopped;
}

void SchedulerSupervisor::retire(const QUuid &id, quint64 serial, ReminderMonitor::Outcome outcome)
{
    OutcomeObserver observer;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_monitors.find(id);
        if (it != m_monitors.end() && it.value()->serial == serial) {
            m_retired.push_back(it.value());
            m_monitors.erase(it);
        }
        observer = m_observer;
    }
    if (observer) {
        observer(id, outcome);
    }
}

void SchedulerSupervisor::reapFinished()
{
    std::vector<std::shared_ptr<MonitorHandle>> finished;
    {
        QMutexLocker locker(&m_mutex);
        auto split = std::partition(m_retired.begin(), m_retired.end(),
                                    [](const std::shared_ptr<MonitorHandle> &handle) {
                                        return !handle->thread->isFinished();
                                    });
        finished.assign(split, m_retired.end());
        m_retired.erase(split, m_retired.end());
    }
    for (const auto &handle : finished) {
        handle->thread->wait();
    }
}

} // namespace scheduling
} // namespace reminder
