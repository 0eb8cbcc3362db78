#pragma once

#include <optional>
#include <vector>

#include "reminder/core/Errors.hpp"
#include "reminder/data/Reminder.hpp"

namespace reminder {
namespace data {

class ReminderRepository
{
public:
    virtual ~ReminderRepository() = default;

    virtual core::Result<std::vector<Reminder>> loadAll() = 0;
    virtual std::optional<core::Error> saveAll(const std::vector<Reminder> &reminders) = 0;
};

} // namespace data
} // namespace reminder
