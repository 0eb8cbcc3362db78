#include "reminder/ui/MainWindow.hpp"

#include <QAction>
#include <QCloseEvent>
#include <QItemSelectionModel>
#include <QKeySequence>
#include <QLabel>
#include <QMessageBox>
#include <QStatusBar>
#include <QToolBar>
#include <QVBoxLayout>
#include <QWidget>

#include "reminder/audio/QtSoundPlayer.hpp"
#include "reminder/core/AppContext.hpp"
#include "reminder/core/Errors.hpp"
#include "reminder/core/Logging.hpp"
#include "reminder/core/ReminderService.hpp"
#include "reminder/data/PersistenceWriter.hpp"
#include "reminder/data/ReminderStore.hpp"
#include "reminder/ui/PopupAlertPresenter.hpp"
#include "reminder/ui/dialogs/ReminderEditDialog.hpp"
#include "reminder/ui/models/ReminderListModel.hpp"
#include "reminder/ui/viewmodels/ReminderListViewModel.hpp"
#include "reminder/ui/widgets/ReminderListView.hpp"

namespace reminder {
namespace ui {

MainWindow::MainWindow(core::AppSettings settings, QWidget *parent)
    : QMainWindow(parent)
    , m_appContext(std::make_unique<core::AppContext>(std::move(settings)))
    , m_listViewModel(std::make_unique<ReminderListViewModel>(m_appContext->store()))
    , m_alertPresenter(std::make_unique<PopupAlertPresenter>())
    , m_soundPlayer(std::make_unique<audio::QtSoundPlayer>())
    , m_editDialog(std::make_unique<ReminderEditDialog>(this))
{
    setupUi();

    connect(&m_appContext->persistenceWriter(), &data::PersistenceWriter::saveFailed, this,
            &MainWindow::showPersistenceWarning, Qt::QueuedConnection);
    connect(m_listViewModel.get(), &ReminderListViewModel::remindersChanged, this, &MainWindow::updateActions);

    loadReminders();
    m_appContext->startDelivery(*m_alertPresenter, *m_soundPlayer, this);
}

MainWindow::~MainWindow()
{
    if (!m_shutDown) {
        m_appContext->shutdown();
    }
}

void MainWindow::setupUi()
{
    setWindowTitle(tr("Reminder App"));
    resize(360, 640);

    auto *toolbar = new QToolBar(tr("Reminders"), this);
    toolbar->setMovable(false);
    addToolBar(Qt::TopToolBarArea, toolbar);

    auto *addAction = toolbar->addAction(tr("Add Reminder"));
    addAction->setShortcut(QKeySequence::New);
    connect(addAction, &QAction::triggered, this, &MainWindow::addReminder);

    m_editAction = toolbar->addAction(tr("Edit"));
    connect(m_editAction, &QAction::triggered, this, &MainWindow::editSelectedReminder);

    m_removeAction = toolbar->addAction(tr("Remove"));
    connect(m_removeAction, &QAction::triggered, this, &MainWindow::removeSelectedReminder);

    auto *centralWidget = new QWidget(this);
    auto *layout = new QVBoxLayout(centralWidget);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_listView = new ReminderListView(centralWidget);
    m_listView->setModel(m_listViewModel->model());
    connect(m_listView, &ReminderListView::editRequested, this, &MainWindow::editReminder);
    connect(m_listView, &ReminderListView::removeRequested, this, &MainWindow::removeReminder);
    connect(m_listView->selectionModel(), &QItemSelectionModel::currentChanged, this, &MainWindow::updateActions);
    layout->addWidget(m_listView);

    setCentralWidget(centralWidget);

    m_summaryLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_summaryLabel);
    statusBar()->showMessage(tr("Ready"));
    updateActions();
}

void MainWindow::loadReminders()
{
    auto loaded = m_appContext->reminderService().loadAll();
    if (!loaded) {
        showPersistenceWarning(loaded.error().message);
    } else if (loaded.value().normalized > 0) {
        statusBar()->showMessage(tr("%n past reminder(s) marked as expired", nullptr, loaded.value().normalized),
                                 4000);
    }
    m_listViewModel->refresh();
}

void MainWindow::addReminder()
{
    m_editDialog->startCreate();
    while (m_editDialog->exec() == QDialog::Accepted) {
        const auto result = m_appContext->reminderService().addReminder(m_editDialog->draft());
        if (result) {
            statusBar()->showMessage(tr("Reminder added successfully!"), 2000);
            return;
        }
        showError(result.error());
    }
}

void MainWindow::editReminder(const QUuid &id)
{
    const auto reminder = m_appContext->store().get(id);
    if (!reminder) {
        showError(core::Error{ core::ErrorKind::NotFound, tr("Reminder not found.") });
        return;
    }
    m_editDialog->startEdit(*reminder);
    while (m_editDialog->exec() == QDialog::Accepted) {
        const auto result = m_appContext->reminderService().updateReminder(m_editDialog->reminderId(),
                                                                           m_editDialog->draft());
        if (result) {
            statusBar()->showMessage(tr("Reminder updated successfully!"), 2000);
            return;
        }
        showError(result.error());
        if (result.error().kind == core::ErrorKind::NotFound) {
            return;
        }
    }
}

void MainWindow::editSelectedReminder()
{
    const QUuid id = m_listView->currentReminderId();
    if (!id.isNull()) {
        editReminder(id);
    }
}

void MainWindow::removeReminder(const QUuid &id)
{
    const auto result = m_appContext->reminderService().removeReminder(id);
    if (!result) {
        showError(result.error());
        return;
    }
    statusBar()->showMessage(tr("Reminder removed."), 2000);
}

void MainWindow::removeSelectedReminder()
{
    const QUuid id = m_listView->currentReminderId();
    if (!id.isNull()) {
        removeReminder(id);
    }
}

void MainWindow::updateActions()
{
    const bool hasSelection = !m_listView->currentReminderId().isNull();
    m_editAction->setEnabled(hasSelection);
    m_removeAction->setEnabled(hasSelection);

    const auto *model = m_listViewModel->model();
    int active = 0;
    for (int row = 0; row < model->rowCount(); ++row) {
        if (model->data(model->index(row, 0), ReminderListModel::ActiveRole).toBool()) {
            ++active;
        }
    }
    m_summaryLabel->setText(tr("%1 active / %2 total").arg(active).arg(model->rowCount()));
}

void MainWindow::showError(const core::Error &error)
{
    QMessageBox::warning(this, tr("Error"), error.message);
}

void MainWindow::showPersistenceWarning(const QString &message)
{
    statusBar()->showMessage(tr("Could not save reminders: %1").arg(message), 5000);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (!m_shutDown) {
        m_shutDown = true;
        m_appContext->shutdown();
    }
    QMainWindow::closeEvent(event);
}

} // namespace ui
} // namespace reminder
