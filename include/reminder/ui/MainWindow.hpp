#pragma once

#include <QMainWindow>
#include <QUuid>
#include <memory>

#include "reminder/core/AppSettings.hpp"

class QAction;
class QLabel;

namespace reminder {
namespace audio {
class QtSoundPlayer;
}
namespace core {
class AppContext;
struct Error;
}

namespace ui {

class PopupAlertPresenter;
class ReminderEditDialog;
class ReminderListView;
class ReminderListViewModel;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(core::AppSettings settings, QWidget *parent = nullptr);
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent *event) override;

private:
    void setupUi();
    void loadReminders();
    void addReminder();
    void editReminder(const QUuid &id);
    void editSelectedReminder();
    void removeReminder(const QUuid &id);
    void removeSelectedReminder();
    void updateActions();
    void showError(const core::Error &error);
    void showPersistenceWarning(const QString &message);

    std::unique_ptr<core::AppContext> m_appContext;
    std::unique_ptr<ReminderListViewModel> m_listViewModel;
    std::unique_ptr<PopupAlertPresenter> m_alertPresenter;
    std::unique_ptr<audio::QtSoundPlayer> m_soundPlayer;
    std::unique_ptr<ReminderEditDialog> m_editDialog;
    ReminderListView *m_listView = nullptr;
    QLabel *m_summaryLabel = nullptr;
    QAction *m_editAction = nullptr;
    QAction *m_removeAction = nullptr;
    bool m_shutDown = false;
};

} // namespace ui
} // namespace reminder
