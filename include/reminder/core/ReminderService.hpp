#pragma once

#include <QObject>
#include <QUuid>
#include <vector>

#include "reminder/core/Errors.hpp"
#include "reminder/core/ReminderInput.hpp"
#include "reminder/data/Reminder.hpp"

namespace reminder {
namespace data {
class ReminderRepository;
class ReminderStore;
}
namespace scheduling {
class SchedulerSupervisor;
}

namespace core {

struct LoadReport
{
    int loaded = 0;
    int normalized = 0; // past-due reminders switched to inactive
    int scheduled = 0;
};

// Entry point for the UI and load path: validates input, mutates the store
// and keeps the supervisor's monitors in step with it.
class ReminderService : public QObject
{
    Q_OBJECT

public:
    ReminderService(data::ReminderStore &store, data::ReminderRepository &repository,
                    scheduling::SchedulerSupervisor &supervisor, QObject *parent = nullptr);
    ~ReminderService() override;

    Result<LoadReport> loadAll();

    Result<data::Reminder> addReminder(const ReminderDraft &draft);
    Result<data::Reminder> addReminder(const ReminderFields &fields);
    Result<data::Reminder> updateReminder(const QUuid &id, const ReminderDraft &draft);
    Result<data::Reminder> updateReminder(const QUuid &id, const ReminderFields &fields);
    Result<data::Reminder> removeReminder(const QUuid &id);

    std::vector<data::Reminder> reminders() const;

    void setCancelTimeout(int timeoutMs);

signals:
    void operationFailed(const reminder::core::Error &error);

private:
    std::optional<Error> validate(const ReminderFields &fields) const;
    template <typename T>
    Result<T> fail(Error error);

    data::ReminderStore &m_store;
    data::ReminderRepository &m_repository;
    scheduling::SchedulerSupervisor &m_supervisor;
    int m_cancelTimeoutMs = 1000;
};

} // namespace core
} // namespace reminder

Q_DECLARE_METATYPE(reminder::core::Error)
