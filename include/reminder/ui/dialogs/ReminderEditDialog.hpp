#pragma once

#include <QDialog>
#include <QUuid>

#include "reminder/core/ReminderInput.hpp"
#include "reminder/data/Reminder.hpp"

class QLineEdit;
class QDateEdit;
class QPlainTextEdit;

namespace reminder {
namespace ui {

// One form for both creating and editing; the mode is explicit.
class ReminderEditDialog : public QDialog
{
    Q_OBJECT

public:
    enum class Mode
    {
        Create,
        Edit,
    };

    explicit ReminderEditDialog(QWidget *parent = nullptr);

    void startCreate();
    void startEdit(const data::Reminder &reminder);
    void setDraft(const core::ReminderDraft &draft);

    Mode mode() const;
    QUuid reminderId() const;
    core::ReminderDraft draft() const;

private:
    Mode m_mode = Mode::Create;
    QUuid m_reminderId;
    QLineEdit *m_titleEdit = nullptr;
    QPlainTextEdit *m_descriptionEdit = nullptr;
    QDateEdit *m_dateEdit = nullptr;
    QLineEdit *m_timeEdit = nullptr;
};

} // namespace ui
} // namespace reminder
