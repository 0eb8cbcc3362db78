#include "reminder/ui/models/ReminderListModel.hpp"

#include <QBrush>
#include <QColor>

namespace reminder {
namespace ui {

ReminderListModel::ReminderListModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

int ReminderListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_reminders.size();
}

QVariant ReminderListModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_reminders.size()) {
        return {};
    }

    const auto &reminder = m_reminders.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
        return reminder.title;
    case Qt::ToolTipRole:
        return reminder.description;
    case Qt::ForegroundRole:
        if (!reminder.active) {
            return QBrush(QColor(Qt::gray));
        }
        return {};
    case IdRole:
        return reminder.id;
    case TriggerTimeRole:
        return reminder.triggerTime;
    case ActiveRole:
        return reminder.active;
    case ScheduleTextRole:
        return scheduleText(reminder);
    default:
        return {};
    }
}

Qt::ItemFlags ReminderListModel::flags(const QModelIndex &index) const
{
    auto defaultFlags = QAbstractListModel::flags(index);
    if (!index.isValid()) {
        return defaultFlags;
    }
    return defaultFlags | Qt::ItemIsSelectable | Qt::ItemIsEnabled;
}

void ReminderListModel::setReminders(QVector<data::Reminder> reminders)
{
    beginResetModel();
    m_reminders = std::move(reminders);
    endResetModel();
}

const data::Reminder *ReminderListModel::reminderAt(const QModelIndex &index) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_reminders.size()) {
        return nullptr;
    }
    return &m_reminders.at(index.row());
}

QModelIndex ReminderListModel::indexOf(const QUuid &id) const
{
    for (int row = 0; row < m_reminders.size(); ++row) {
        if (m_reminders.at(row).id == id) {
            return index(row, 0);
        }
    }
    return {};
}

QString ReminderListModel::scheduleText(const data::Reminder &reminder)
{
    const QString status = reminder.active ? tr("Active") : tr("Expired");
    return tr("%1 (%2)").arg(reminder.triggerTime.toString(QStringLiteral("yyyy-MM-dd HH:mm")), status);
}

} // namespace ui
} // namespace reminder
