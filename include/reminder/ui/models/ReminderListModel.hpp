#pragma once

#include <QAbstractListModel>
#include <QVector>

#include "reminder/data/Reminder.hpp"

namespace reminder {
namespace ui {

class ReminderListModel : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles
    {
        IdRole = Qt::UserRole + 1,
        TriggerTimeRole,
        ActiveRole,
        ScheduleTextRole,
    };

    explicit ReminderListModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;

    void setReminders(QVector<data::Reminder> reminders);
    const data::Reminder *reminderAt(const QModelIndex &index) const;
    QModelIndex indexOf(const QUuid &id) const;

    static QString scheduleText(const data::Reminder &reminder);

private:
    QVector<data::Reminder> m_reminders;
};

} // namespace ui
} // namespace reminder
