#pragma once

#include <QMutex>

#include "reminder/data/ReminderRepository.hpp"

namespace reminder {
namespace data {

class InMemoryReminderRepository : public ReminderRepository
{
public:
    InMemoryReminderRepository();
    explicit InMemoryReminderRepository(std::vector<Reminder> initial);
    ~InMemoryReminderRepository() override;

    core::Result<std::vector<Reminder>> loadAll() override;
    std::optional<core::Error> saveAll(const std::vector<Reminder> &reminders) override;

    void setFailing(bool failing);
    std::vector<Reminder> saved() const;
    int saveCount() const;

private:
    mutable QMutex m_mutex;
    std::vector<Reminder> m_reminders;
    bool m_failing = false;
    int m_saveCount = 0;
};

} // namespace data
} // namespace reminder
