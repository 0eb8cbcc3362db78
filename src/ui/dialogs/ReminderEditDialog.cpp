#include "reminder/ui/dialogs/ReminderEditDialog.hpp"

#include <QDate>
#include <QDateEdit>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QVBoxLayout>

namespace reminder {
namespace ui {

ReminderEditDialog::ReminderEditDialog(QWidget *parent)
    : QDialog(parent)
{
    auto *layout = new QVBoxLayout(this);
    auto *formLayout = new QFormLayout();

    m_titleEdit = new QLineEdit(this);
    formLayout->addRow(tr("Reminder Title:"), m_titleEdit);

    m_descriptionEdit = new QPlainTextEdit(this);
    m_descriptionEdit->setFixedHeight(80);
    formLayout->addRow(tr("Description:"), m_descriptionEdit);

    m_dateEdit = new QDateEdit(this);
    m_dateEdit->setDisplayFormat(QStringLiteral("yyyy-MM-dd"));
    m_dateEdit->setCalendarPopup(true);
    formLayout->addRow(tr("Select Date:"), m_dateEdit);

    m_timeEdit = new QLineEdit(this);
    m_timeEdit->setPlaceholderText(tr("HH:MM"));
    m_timeEdit->setMaxLength(5);
    formLayout->addRow(tr("Time (HH:MM):"), m_timeEdit);

    layout->addLayout(formLayout);

    auto *buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    layout->addWidget(buttonBox);

    startCreate();
}

void ReminderEditDialog::startCreate()
{
    m_mode = Mode::Create;
    m_reminderId = QUuid();
    setWindowTitle(tr("Add Reminder"));
    m_titleEdit->clear();
    m_descriptionEdit->clear();
    m_dateEdit->setDate(QDate::currentDate());
    m_timeEdit->clear();
    m_titleEdit->setFocus();
}

void ReminderEditDialog::startEdit(const data::Reminder &reminder)
{
    m_mode = Mode::Edit;
    m_reminderId = reminder.id;
    setWindowTitle(tr("Edit Reminder"));
    setDraft(core::draftFromReminder(reminder));
    m_titleEdit->setFocus();
}

void ReminderEditDialog::setDraft(const core::ReminderDraft &draft)
{
    m_titleEdit->setText(draft.title);
    m_descriptionEdit->setPlainText(draft.description);
    m_dateEdit->setDate(draft.date.isValid() ? draft.date : QDate::currentDate());
    m_timeEdit->setText(draft.timeText);
}

ReminderEditDialog::Mode ReminderEditDialog::mode() const
{
    return m_mode;
}

QUuid ReminderEditDialog::reminderId() const
{
    return m_reminderId;
}

core::ReminderDraft ReminderEditDialog::draft() const
{
    core::ReminderDraft draft;
    draft.title = m_titleEdit->text();
    draft.description = m_descriptionEdit->toPlainText();
    draft.date = m_dateEdit->date();
    draft.timeText = m_timeEdit->text();
    return draft;
}

} // namespace ui
} // namespace reminder
