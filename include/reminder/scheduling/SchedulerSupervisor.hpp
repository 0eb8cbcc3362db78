#pragma once

#include <QHash>
#include <QMutex>
#include <QUuid>
#include <functional>
#include <memory>
#include <vector>

#include "reminder/core/CancellationToken.hpp"
#include "reminder/scheduling/ReminderMonitor.hpp"

class QThread;

namespace reminder {
namespace data {
class ReminderStore;
struct Reminder;
}

namespace scheduling {

class NotificationQueue;

// Owns one monitor thread per active reminder and keeps at most one live
// monitor per reminder id.
class SchedulerSupervisor
{
public:
    using OutcomeObserver = std::function<void(const QUuid &, ReminderMonitor::Outcome)>;

    SchedulerSupervisor(data::ReminderStore &store, NotificationQueue &queue,
                        core::CancellationToken shutdownToken, int pollIntervalMs);
    ~SchedulerSupervisor();

    SchedulerSupervisor(const SchedulerSupervisor &) = delete;
    SchedulerSupervisor &operator=(const SchedulerSupervisor &) = delete;

    // Called from monitor threads; set before spawning.
    void setOutcomeObserver(OutcomeObserver observer);

    bool spawn(const data::Reminder &reminder);
    bool cancel(const QUuid &id, int timeoutMs = 1000);
    bool reschedule(const data::Reminder &reminder, int timeoutMs = 1000);

    bool isMonitoring(const QUuid &id) const;
    int monitorCount() const;
    bool isShutDown() const;

    // Broadcasts cancellation to all monitors and waits for them.
    // Returns false if some monitor did not exit within timeoutMs.
    bool shutdown(int timeoutMs);

private:
    struct MonitorHandle
    {
        quint64 serial = 0;
        core::CancellationToken token;
        std::unique_ptr<QThread> thread;
    };

    void retire(const QUuid &id, quint64 serial, ReminderMonitor::Outcome outcome);
    void reapFinished();

    data::ReminderStore &m_store;
    NotificationQueue &m_queue;
    core::CancellationToken m_shutdownToken;
    int m_pollIntervalMs = 1000;
    OutcomeObserver m_observer;

    mutable QMutex m_mutex;
    QHash<QUuid, std::shared_ptr<MonitorHandle>> m_monitors;
    std::vector<std::shared_ptr<MonitorHandle>> m_retired;
    quint64 m_nextSerial = 0;
    bool m_shutDown = false;
};

} // namespace scheduling
} // namespace reminder
