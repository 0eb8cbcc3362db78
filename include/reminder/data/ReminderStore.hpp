#pragma once

#include <QHash>
#include <QMutex>
#include <QObject>
#include <functional>
#include <optional>
#include <vector>

#include "reminder/data/Reminder.hpp"

namespace reminder {
namespace data {

// Single source of truth for reminders. Every operation takes the same
// mutex, so all callers observe one total order of mutations. Signals are
// emitted after the mutex is released.
class ReminderStore : public QObject
{
    Q_OBJECT

public:
    enum class Status
    {
        Ok,
        NotFound,
        Unchanged,
    };

    explicit ReminderStore(QObject *parent = nullptr);
    ~ReminderStore() override;

    Reminder insert(Reminder reminder);
    Status update(const Reminder &reminder, Reminder *stored = nullptr);
    Reminder upsert(Reminder reminder);

    std::optional<Reminder> get(const QUuid &id) const;
    std::optional<Reminder> remove(const QUuid &id);
    std::vector<Reminder> listAll() const;
    Status setActive(const QUuid &id, bool active);
    int size() const;

    // Performs the active:true->false transition for the given schedule
    // revision. onClaimed runs while the store is still locked, so callers
    // that enqueue from it see the claim order.
    std::optional<Reminder> claimFiring(const QUuid &id, quint64 revision,
                                        const std::function<void(const Reminder &)> &onClaimed = {});

signals:
    void reminderChanged(const QUuid &id);
    void reminderRemoved(const QUuid &id);
    void changed();

private:
    quint64 nextRevision();

    mutable QMutex m_mutex;
    QHash<QUuid, Reminder> m_items;
    quint64 m_revisionCounter = 0;
};

} // namespace data
} // namespace reminder
