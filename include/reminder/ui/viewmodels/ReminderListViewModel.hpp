#pragma once

#include <QObject>
#include <memory>

namespace reminder {
namespace data {
class ReminderStore;
}

namespace ui {

class ReminderListModel;

// Mirrors the store into a list model. Store signals arrive from monitor
// threads and are queued onto this object's (the UI) thread.
class ReminderListViewModel : public QObject
{
    Q_OBJECT
public:
    ReminderListViewModel(data::ReminderStore &store, QObject *parent = nullptr);
    ~ReminderListViewModel() override;

    ReminderListModel *model() const;

public slots:
    void refresh();

signals:
    void remindersChanged();

private:
    data::ReminderStore &m_store;
    std::unique_ptr<ReminderListModel> m_model;
};

} // namespace ui
} // namespace reminder
