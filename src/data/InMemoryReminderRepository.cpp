#include "reminder/data/InMemoryReminderRepository.hpp"

#include <QMutexLocker>

namespace reminder {
namespace data {

InMemoryReminderRepository::InMemoryReminderRepository() = default;

InMemoryReminderRepository::InMemoryReminderRepository(std::vector<Reminder> initial)
    : m_reminders(std::move(initial))
{
}

InMemoryReminderRepository::~InMemoryReminderRepository() = default;

core::Result<std::vector<Reminder>> InMemoryReminderRepository::loadAll()
{
    QMutexLocker locker(&m_mutex);
    if (m_failing) {
        return core::Result<std::vector<Reminder>>::failure(core::ErrorKind::PersistenceFailure,
                                                            QStringLiteral("In-memory repository set to fail"));
    }
    return core::Result<std::vector<Reminder>>::success(m_reminders);
}

std::optional<core::Error> InMemoryReminderRepository::saveAll(const std::vector<Reminder> &reminders)
{
    QMutexLocker locker(&m_mutex);
    ++m_saveCount;
    if (m_failing) {
        return core::Error{ core::ErrorKind::PersistenceFailure, QStringLiteral("In-memory repository set to fail") };
    }
    m_reminders = reminders;
    return std::nullopt;
}

void InMemoryReminderRepository::setFailing(bool failing)
{
    QMutexLocker locker(&m_mutex);
    m_failing = failing;
}

std::vector<Reminder> InMemoryReminderRepository::saved() const
{
    QMutexLocker locker(&m_mutex);
    return m_reminders;
}

int InMemoryReminderRepository::saveCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_saveCount;
}

} // namespace data
} // namespace reminder
