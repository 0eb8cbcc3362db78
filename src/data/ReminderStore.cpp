#include "reminder/data/ReminderStore.hpp"

#include <QMutexLocker>
#include <algorithm>

#include "reminder/core/Logging.hpp"

namespace reminder {
namespace data {

ReminderStore::ReminderStore(QObject *parent)
    : QObject(parent)
{
}

ReminderStore::~ReminderStore() = default;

quint64 ReminderStore::nextRevision()
{
    return ++m_revisionCounter;
}

Reminder ReminderStore::insert(Reminder reminder)
{
    {
        QMutexLocker locker(&m_mutex);
        if (reminder.id.isNull()) {
            reminder.id = QUuid::createUuid();
        }
        while (m_items.contains(reminder.id)) {
            reminder.id = QUuid::createUuid();
        }
        reminder.revision = nextRevision();
        m_items.insert(reminder.id, reminder);
    }
    qCDebug(lcStore) << "inserted" << reminder.id << "revision" << reminder.revision;
    emit reminderChanged(reminder.id);
    emit changed();
    return reminder;
}

ReminderStore::Status ReminderStore::update(const Reminder &reminder, Reminder *stored)
{
    Reminder updated = reminder;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_items.find(reminder.id);
        if (it == m_items.end()) {
            qCDebug(lcStore) << "update of unknown reminder" << reminder.id;
            return Status::NotFound;
        }
        updated.revision = nextRevision();
        it.value() = updated;
    }
    if (stored) {
        *stored = updated;
    }
    qCDebug(lcStore) << "updated" << updated.id << "revision" << updated.revision;
    emit reminderChanged(updated.id);
    emit changed();
    return Status::Ok;
}

Reminder ReminderStore::upsert(Reminder reminder)
{
    {
        QMutexLocker locker(&m_mutex);
        if (reminder.id.isNull()) {
            reminder.id = QUuid::createUuid();
        }
        reminder.revision = nextRevision();
        m_items.insert(reminder.id, reminder);
    }
    emit reminderChanged(reminder.id);
    emit changed();
    return reminder;
}

std::optional<Reminder> ReminderStore::get(const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_items.constFind(id);
    if (it == m_items.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

std::optional<Reminder> ReminderStore::remove(const QUuid &id)
{
    Reminder removed;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_items.find(id);
        if (it == m_items.end()) {
            return std::nullopt;
        }
        removed = it.value();
        m_items.erase(it);
    }
    removed.active = false;
    qCDebug(lcStore) << "removed" << id;
    emit reminderRemoved(id);
    emit changed();
    return removed;
}

std::vector<Reminder> ReminderStore::listAll() const
{
    std::vector<Reminder> result;
    {
        QMutexLocker locker(&m_mutex);
        result.reserve(static_cast<size_t>(m_items.size()));
        for (const auto &item : m_items) {
            result.push_back(item);
        }
    }
    std::sort(result.begin(), result.end(), [](const Reminder &lhs, const Reminder &rhs) {
        if (lhs.triggerTime == rhs.triggerTime) {
            return lhs.title.toLower() < rhs.title.toLower();
        }
        return lhs.triggerTime < rhs.triggerTime;
    });
    return result;
}

ReminderStore::Status ReminderStore::setActive(const QUuid &id, bool active)
{
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_items.find(id);
        if (it == m_items.end()) {
            return Status::NotFound;
        }
        if (it->active == active) {
            return Status::Unchanged;
        }
        it->active = active;
        if (active) {
            it->revision = nextRevision();
        }
    }
    emit reminderChanged(id);
    emit changed();
    return Status::Ok;
}

int ReminderStore::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_items.size();
}

std::optional<Reminder> ReminderStore::claimFiring(const QUuid &id, quint64 revision,
                                                   const std::function<void(const Reminder &)> &onClaimed)
{
    Reminder snapshot;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_items.find(id);
        if (it == m_items.end()) {
            qCDebug(lcStore) << "claim for removed reminder" << id;
            return std::nullopt;
        }
        if (!it->active || it->revision != revision) {
            qCDebug(lcStore) << "claim rejected for" << id << "active" << it->active
                             << "revision" << it->revision << "expected" << revision;
            return std::nullopt;
        }
        it->active = false;
        snapshot = it.value();
        if (onClaimed) {
            onClaimed(snapshot);
        }
    }
    emit reminderChanged(id);
    emit changed();
    return snapshot;
}

} // namespace data
} // namespace reminder
