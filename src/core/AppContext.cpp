#include "reminder/core/AppContext.hpp"

#include <QDeadlineTimer>

#include "reminder/audio/SoundPlayer.hpp"
#include "reminder/core/Logging.hpp"
#include "reminder/core/ReminderService.hpp"
#include "reminder/data/FileReminderRepository.hpp"
#include "reminder/data/PersistenceWriter.hpp"
#include "reminder/data/ReminderStore.hpp"
#include "reminder/scheduling/NotificationDispatcher.hpp"
#include "reminder/scheduling/NotificationQueue.hpp"
#include "reminder/scheduling/SchedulerSupervisor.hpp"

namespace reminder {
namespace core {

AppContext::AppContext(AppSettings settings)
    : AppContext(settings, std::make_unique<data::FileReminderRepository>(settings.storageFilePath))
{
}

AppContext::AppContext(AppSettings settings, std::unique_ptr<data::ReminderRepository> repository)
    : m_settings(std::move(settings))
    , m_repository(std::move(repository))
    , m_store(std::make_unique<data::ReminderStore>())
    , m_queue(std::make_unique<scheduling::NotificationQueue>())
    , m_supervisor(std::make_unique<scheduling::SchedulerSupervisor>(*m_store, *m_queue, m_shutdownToken,
                                                                      m_settings.pollIntervalMs))
    , m_persistenceWriter(std::make_unique<data::PersistenceWriter>(*m_store, *m_repository))
    , m_reminderService(std::make_unique<ReminderService>(*m_store, *m_repository, *m_supervisor))
{
    m_reminderService->setCancelTimeout(m_settings.pollIntervalMs * 2);

    m_persistenceThread.setObjectName(QStringLiteral("persistence"));
    m_persistenceWriter->moveToThread(&m_persistenceThread);
    QObject::connect(m_store.get(), &data::ReminderStore::changed, m_persistenceWriter.get(),
                     &data::PersistenceWriter::requestSave, Qt::DirectConnection);
    m_persistenceThread.start();
}

AppContext::~AppContext()
{
    shutdown();
}

const AppSettings &AppContext::settings() const
{
    return m_settings;
}

data::ReminderStore &AppContext::store()
{
    return *m_store;
}

scheduling::NotificationQueue &AppContext::notificationQueue()
{
    return *m_queue;
}

scheduling::SchedulerSupervisor &AppContext::supervisor()
{
    return *m_supervisor;
}

data::PersistenceWriter &AppContext::persistenceWriter()
{
    return *m_persistenceWriter;
}

ReminderService &AppContext::reminderService()
{
    return *m_reminderService;
}

void AppContext::startDelivery(scheduling::AlertPresenter &presenter, audio::SoundPlayer &player,
                               QObject *uiContext)
{
    if (m_dispatcher || m_shutDown) {
        return;
    }
    scheduling::DispatcherOptions options;
    options.soundRef = m_settings.soundFile;
    options.soundEnabled = m_settings.soundEnabled;
    options.alertDurationMs = m_settings.alertDurationMs;

    m_player = &player;
    m_dispatcher = std::make_unique<scheduling::NotificationDispatcher>(*m_queue, presenter, player, uiContext,
                                                                        m_shutdownToken, options);
    m_dispatcher->start();
}

scheduling::NotificationDispatcher *AppContext::dispatcher() const
{
    return m_dispatcher.get();
}

bool AppContext::shutdown()
{
    if (m_shutDown) {
        return true;
    }
    m_shutDown = true;
    qCInfo(lcSupervisor) << "shutting down";

    const int timeoutMs = m_settings.shutdownTimeoutMs;
    QDeadlineTimer deadline(timeoutMs);

    // Cancelling the shared token reaches every monitor and the dispatcher.
    m_shutdownToken.cancel();
    bool clean = m_supervisor->shutdown(static_cast<int>(deadline.remainingTime()));
    if (m_dispatcher) {
        clean = m_dispatcher->stop(static_cast<int>(qMax<qint64>(0, deadline.remainingTime()))) && clean;
    }
    if (m_player) {
        m_player->stopAll();
    }

    QObject::disconnect(m_store.get(), nullptr, m_persistenceWriter.get(), nullptr);
    m_persistenceThread.quit();
    m_persistenceThread.wait();
    // A save posted to the stopped thread would be lost; run it here instead.
    if (m_persistenceWriter->hasPendingSave()) {
        m_persistenceWriter->writeSnapshot();
    }

    if (!clean) {
        qCWarning(lcSupervisor) << "shutdown did not complete within" << timeoutMs << "ms";
    }
    return clean;
}

} // namespace core
} // namespace reminder
