#pragma once

#include <QAtomicInt>
#include <QPointer>
#include <QString>
#include <memory>

#include "reminder/core/CancellationToken.hpp"
#include "reminder/data/Reminder.hpp"

class QObject;
class QThread;

namespace reminder {
namespace audio {
class SoundPlayer;
}

namespace scheduling {

class AlertPresenter;
class NotificationQueue;

struct DispatcherOptions
{
    QString soundRef;
    bool soundEnabled = true;
    int alertDurationMs = 5000;
    int popTimeoutMs = 250;
};

// Single consumer of the notification queue. Audio is requested without
// waiting for it; alerts are built on the UI thread owned by uiContext.
class NotificationDispatcher
{
public:
    NotificationDispatcher(NotificationQueue &queue, AlertPresenter &presenter, audio::SoundPlayer &player,
                           QObject *uiContext, core::CancellationToken shutdownToken,
                           DispatcherOptions options = {});
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher &) = delete;
    NotificationDispatcher &operator=(const NotificationDispatcher &) = delete;

    void start();
    bool stop(int timeoutMs);
    bool isRunning() const;
    int deliveredCount() const;

private:
    void run();
    void deliver(const data::NotificationEvent &event);

    NotificationQueue &m_queue;
    AlertPresenter &m_presenter;
    audio::SoundPlayer &m_player;
    QPointer<QObject> m_uiContext;
    core::CancellationToken m_token;
    DispatcherOptions m_options;
    std::unique_ptr<QThread> m_thread;
    QAtomicInt m_delivered;
};

} // namespace scheduling
} // namespace reminder
