#include "reminder/ui/viewmodels/ReminderListViewModel.hpp"

#include <QVector>

#include "reminder/data/ReminderStore.hpp"
#include "reminder/ui/models/ReminderListModel.hpp"

namespace reminder {
namespace ui {

ReminderListViewModel::ReminderListViewModel(data::ReminderStore &store, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_model(std::make_unique<ReminderListModel>())
{
    connect(&m_store, &data::ReminderStore::changed, this, &ReminderListViewModel::refresh, Qt::QueuedConnection);
}

ReminderListViewModel::~ReminderListViewModel() = default;

ReminderListModel *ReminderListViewModel::model() const
{
    return m_model.get();
}

void ReminderListViewModel::refresh()
{
    const auto reminders = m_store.listAll();
    QVector<data::Reminder> items;
    items.reserve(static_cast<int>(reminders.size()));
    for (const auto &reminder : reminders) {
        items.append(reminder);
    }
    m_model->setReminders(std::move(items));
    emit remindersChanged();
}

} // namespace ui
} // namespace reminder
