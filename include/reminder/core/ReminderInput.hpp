#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>

#include "reminder/core/Errors.hpp"
#include "reminder/data/Reminder.hpp"

namespace reminder {
namespace core {

// Raw values as entered in the reminder form.
struct ReminderDraft
{
    QString title;
    QString description;
    QDate date;
    QString timeText; // "HH:MM", 24-hour
};

struct ReminderFields
{
    QString title;
    QString description;
    QDateTime triggerTime;
};

// Rejects empty titles, malformed times and instants before now.
Result<ReminderFields> parseDraft(const ReminderDraft &draft, const QDateTime &now);

ReminderDraft draftFromReminder(const data::Reminder &reminder);

} // namespace core
} // namespace reminder
