#pragma once

#include <QThread>
#include <memory>

#include "reminder/core/AppSettings.hpp"
#include "reminder/core/CancellationToken.hpp"

class QObject;

namespace reminder {
namespace audio {
class SoundPlayer;
}
namespace data {
class PersistenceWriter;
class ReminderRepository;
class ReminderStore;
}
namespace scheduling {
class AlertPresenter;
class NotificationDispatcher;
class NotificationQueue;
class SchedulerSupervisor;
}

namespace core {

class ReminderService;

class AppContext
{
public:
    explicit AppContext(AppSettings settings);
    AppContext(AppSettings settings, std::unique_ptr<data::ReminderRepository> repository);
    ~AppContext();

    AppContext(const AppContext &) = delete;
    AppContext &operator=(const AppContext &) = delete;

    const AppSettings &settings() const;
    data::ReminderStore &store();
    scheduling::NotificationQueue &notificationQueue();
    scheduling::SchedulerSupervisor &supervisor();
    data::PersistenceWriter &persistenceWriter();
    ReminderService &reminderService();

    // Starts the dispatcher; presenter, player and uiContext must outlive shutdown().
    void startDelivery(scheduling::AlertPresenter &presenter, audio::SoundPlayer &player, QObject *uiContext);
    scheduling::NotificationDispatcher *dispatcher() const;

    // The only coordinated teardown point. Safe to call more than once.
    bool shutdown();

private:
    AppSettings m_settings;
    CancellationToken m_shutdownToken;
    std::unique_ptr<data::ReminderRepository> m_repository;
    std::unique_ptr<data::ReminderStore> m_store;
    std::unique_ptr<scheduling::NotificationQueue> m_queue;
    std::unique_ptr<scheduling::SchedulerSupervisor> m_supervisor;
    QThread m_persistenceThread;
    std::unique_ptr<data::PersistenceWriter> m_persistenceWriter;
    std::unique_ptr<ReminderService> m_reminderService;
    std::unique_ptr<scheduling::NotificationDispatcher> m_dispatcher;
    audio::SoundPlayer *m_player = nullptr;
    bool m_shutDown = false;
};

} // namespace core
} // namespace reminder
