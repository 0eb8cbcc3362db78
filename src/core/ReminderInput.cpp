#include "reminder/core/ReminderInput.hpp"

#include <QObject>
#include <QRegularExpression>
#include <QTime>

namespace reminder {
namespace core {

namespace {
constexpr auto TIME_FORMAT = "HH:mm";
}

Result<ReminderFields> parseDraft(const ReminderDraft &draft, const QDateTime &now)
{
    const QString title = draft.title.trimmed();
    if (title.isEmpty()) {
        return Result<ReminderFields>::failure(ErrorKind::InvalidInput, QObject::tr("Title cannot be empty"));
    }

    static const QRegularExpression timePattern(QStringLiteral("^\\d{1,2}:\\d{2}$"));
    const QString timeText = draft.timeText.trimmed();
    QTime time;
    if (timePattern.match(timeText).hasMatch()) {
        time = QTime::fromString(timeText.rightJustified(5, QLatin1Char('0')), QLatin1String(TIME_FORMAT));
    }
    if (!draft.date.isValid() || !time.isValid()) {
        return Result<ReminderFields>::failure(ErrorKind::InvalidInput,
                                               QObject::tr("Invalid time format. Use HH:MM (24-hour)"));
    }

    const QDateTime trigger(draft.date, time);
    if (trigger < now) {
        return Result<ReminderFields>::failure(ErrorKind::InvalidInput,
                                               QObject::tr("You cannot set a reminder in the past."));
    }

    ReminderFields fields;
    fields.title = title;
    fields.description = draft.description.trimmed();
    fields.triggerTime = trigger;
    return Result<ReminderFields>::success(std::move(fields));
}

ReminderDraft draftFromReminder(const data::Reminder &reminder)
{
    ReminderDraft draft;
    draft.title = reminder.title;
    draft.description = reminder.description;
    draft.date = reminder.triggerTime.date();
    draft.timeText = reminder.triggerTime.time().toString(QLatin1String(TIME_FORMAT));
    return draft;
}

} // namespace core
} // namespace reminder
