#include "reminder/core/ReminderService.hpp"

#include <QDateTime>

#include "reminder/core/Logging.hpp"
#include "reminder/data/ReminderRepository.hpp"
#include "reminder/data/ReminderStore.hpp"
#include "reminder/scheduling/SchedulerSupervisor.hpp"

namespace reminder {
namespace core {

ReminderService::ReminderService(data::ReminderStore &store, data::ReminderRepository &repository,
                                 scheduling::SchedulerSupervisor &supervisor, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_repository(repository)
    , m_supervisor(supervisor)
{
    qRegisterMetaType<reminder::core::Error>();
}

ReminderService::~ReminderService() = default;

void ReminderService::setCancelTimeout(int timeoutMs)
{
    m_cancelTimeoutMs = timeoutMs;
}

template <typename T>
Result<T> ReminderService::fail(Error error)
{
    qCWarning(lcStore) << errorKindName(error.kind) << error.message;
    emit operationFailed(error);
    return Result<T>::failure(std::move(error));
}

Result<LoadReport> ReminderService::loadAll()
{
    auto loaded = m_repository.loadAll();
    if (!loaded) {
        return fail<LoadReport>(loaded.error());
    }

    LoadReport report;
    const QDateTime now = QDateTime::currentDateTime();
    for (data::Reminder reminder : loaded.value()) {
        ++report.loaded;
        if (reminder.active && reminder.triggerTime <= now) {
            reminder.active = false;
            ++report.normalized;
        }
        const data::Reminder stored = m_store.upsert(std::move(reminder));
        if (!stored.active) {
            // A duplicate id earlier in the file may have started a monitor.
            m_supervisor.cancel(stored.id, m_cancelTimeoutMs);
            continue;
        }
        if (m_supervisor.reschedule(stored, m_cancelTimeoutMs)) {
            ++report.scheduled;
        }
    }
    qCInfo(lcStore) << "loaded" << report.loaded << "reminders," << report.normalized << "past due,"
                    << report.scheduled << "scheduled";
    return Result<LoadReport>::success(report);
}

std::optional<Error> ReminderService::validate(const ReminderFields &fields) const
{
    if (fields.title.trimmed().isEmpty()) {
        return Error{ ErrorKind::InvalidInput, tr("Title cannot be empty") };
    }
    if (!fields.triggerTime.isValid()) {
        return Error{ ErrorKind::InvalidInput, tr("Invalid time format. Use HH:MM (24-hour)") };
    }
    if (fields.triggerTime <= QDateTime::currentDateTime()) {
        return Error{ ErrorKind::InvalidInput, tr("You cannot set a reminder in the past.") };
    }
    return std::nullopt;
}

Result<data::Reminder> ReminderService::addReminder(const ReminderDraft &draft)
{
    auto fields = parseDraft(draft, QDateTime::currentDateTime());
    if (!fields) {
        return fail<data::Reminder>(fields.error());
    }
    return addReminder(fields.value());
}

Result<data::Reminder> ReminderService::addReminder(const ReminderFields &fields)
{
    if (auto error = validate(fields)) {
        return fail<data::Reminder>(*error);
    }

    data::Reminder reminder;
    reminder.title = fields.title.trimmed();
    reminder.description = fields.description;
    reminder.triggerTime = fields.triggerTime;
    reminder.active = true;

    const data::Reminder stored = m_store.insert(std::move(reminder));
    m_supervisor.spawn(stored);
    qCInfo(lcStore) << "reminder" << stored.id << "added, due" << stored.triggerTime;
    return Result<data::Reminder>::success(stored);
}

Result<data::Reminder> ReminderService::updateReminder(const QUuid &id, const ReminderDraft &draft)
{
    auto fields = parseDraft(draft, QDateTime::currentDateTime());
    if (!fields) {
        return fail<data::Reminder>(fields.error());
    }
    return updateReminder(id, fields.value());
}

Result<data::Reminder> ReminderService::updateReminder(const QUuid &id, const ReminderFields &fields)
{
    if (auto error = validate(fields)) {
        return fail<data::Reminder>(*error);
    }

    auto existing = m_store.get(id);
    if (!existing) {
        return fail<data::Reminder>(Error{ ErrorKind::NotFound, tr("Reminder not found.") });
    }

    data::Reminder edited = *existing;
    edited.title = fields.title.trimmed();
    edited.description = fields.description;
    edited.triggerTime = fields.triggerTime;
    edited.active = true;

    // The revision bump in update() already invalidates a monitor of the
    // previous schedule; reschedule() additionally stops it right away.
    data::Reminder stored;
    if (m_store.update(edited, &stored) == data::ReminderStore::Status::NotFound) {
        return fail<data::Reminder>(Error{ ErrorKind::NotFound, tr("Reminder not found.") });
    }
    m_supervisor.reschedule(stored, m_cancelTimeoutMs);
    qCInfo(lcStore) << "reminder" << stored.id << "rescheduled to" << stored.triggerTime;
    return Result<data::Reminder>::success(stored);
}

Result<data::Reminder> ReminderService::removeReminder(const QUuid &id)
{
    auto removed = m_store.remove(id);
    if (!removed) {
        return fail<data::Reminder>(Error{ ErrorKind::NotFound, tr("Reminder not found or already removed.") });
    }
    m_supervisor.cancel(id, m_cancelTimeoutMs);
    qCInfo(lcStore) << "reminder" << id << "removed";
    return Result<data::Reminder>::success(*removed);
}

std::vector<data::Reminder> ReminderService::reminders() const
{
    return m_store.listAll();
}

} // namespace core
} // namespace reminder
