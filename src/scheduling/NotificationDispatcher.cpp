#include "reminder/scheduling/NotificationDispatcher.hpp"

#include <QDeadlineTimer>
#include <QMetaObject>
#include <QObject>
#include <QThread>
#include <QTimer>
#include <algorithm>

#include "reminder/audio/SoundPlayer.hpp"
#include "reminder/core/Logging.hpp"
#include "reminder/scheduling/AlertPresenter.hpp"
#include "reminder/scheduling/NotificationQueue.hpp"

namespace reminder {
namespace scheduling {

NotificationDispatcher::NotificationDispatcher(NotificationQueue &queue, AlertPresenter &presenter,
                                               audio::SoundPlayer &player, QObject *uiContext,
                                               core::CancellationToken shutdownToken,
                                               DispatcherOptions options)
    : m_queue(queue)
    , m_presenter(presenter)
    , m_player(player)
    , m_uiContext(uiContext)
    , m_token(shutdownToken.createChild())
    , m_options(std::move(options))
{
}

NotificationDispatcher::~NotificationDispatcher()
{
    stop(m_options.popTimeoutMs * 4);
    if (m_thread) {
        m_thread->wait();
    }
}

void NotificationDispatcher::start()
{
    if (m_thread) {
        return;
    }
    m_thread.reset(QThread::create([this]() { run(); }));
    m_thread->setObjectName(QStringLiteral("notification-dispatcher"));
    m_thread->start();
}

bool NotificationDispatcher::stop(int timeoutMs)
{
    m_token.cancel();
    if (!m_thread) {
        return true;
    }
    if (!m_thread->wait(QDeadlineTimer(std::max(timeoutMs, 0)))) {
        qCWarning(lcDispatch) << "dispatcher did not stop within" << timeoutMs << "ms";
        return false;
    }
    return true;
}

bool NotificationDispatcher::isRunning() const
{
    return m_thread && m_thread->isRunning();
}

int NotificationDispatcher::deliveredCount() const
{
    return m_delivered.loadAcquire();
}

void NotificationDispatcher::run()
{
    qCDebug(lcDispatch) << "dispatcher started";
    while (!m_token.isCancelled()) {
        const auto event = m_queue.pop(m_options.popTimeoutMs);
        if (!event) {
            continue;
        }
        deliver(*event);
    }
    qCDebug(lcDispatch) << "dispatcher stopped," << m_queue.size() << "events left undelivered";
}

void NotificationDispatcher::deliver(const data::NotificationEvent &event)
{
    qCInfo(lcDispatch) << "delivering notification:" << event.title;

    if (m_options.soundEnabled && !m_options.soundRef.isEmpty()) {
        m_player.playAsync(m_options.soundRef);
    }

    QObject *context = m_uiContext.data();
    if (!context) {
        qCWarning(lcDispatch) << "no UI context, alert dropped:" << event.title;
        return;
    }

    AlertPresenter *presenter = &m_presenter;
    const int durationMs = m_options.alertDurationMs;
    const QString title = event.title;
    const QString description = event.description;
    QMetaObject::invokeMethod(
        context,
        [context, presenter, durationMs, title, description]() {
            const auto handle = presenter->presentAlert(title, description);
            QTimer::singleShot(durationMs, context, [presenter, handle]() { presenter->dismiss(handle); });
        },
        Qt::QueuedConnection);
    m_delivered.fetchAndAddOrdered(1);
}

} // namespace scheduling
} // namespace reminder
