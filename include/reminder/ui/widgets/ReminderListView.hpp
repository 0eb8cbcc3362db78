#pragma once

#include <QListView>
#include <QUuid>

namespace reminder {
namespace ui {

// Shows reminders as cards: bold title, schedule line and description.
class ReminderListView : public QListView
{
    Q_OBJECT

public:
    explicit ReminderListView(QWidget *parent = nullptr);

    QUuid currentReminderId() const;

signals:
    void editRequested(const QUuid &id);
    void removeRequested(const QUuid &id);

protected:
    void keyPressEvent(QKeyEvent *event) override;
};

} // namespace ui
} // namespace reminder
