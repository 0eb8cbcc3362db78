#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>

namespace reminder {
namespace data {

struct Reminder
{
    QUuid id = QUuid::createUuid();
    QString title;
    QString description;
    QDateTime triggerTime;
    bool active = true;
    quint64 revision = 0; // assigned by ReminderStore
};

struct NotificationEvent
{
    QString title;
    QString description;
    QDateTime firedAt;
};

} // namespace data
} // namespace reminder
