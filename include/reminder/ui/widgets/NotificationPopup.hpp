#pragma once

#include <QWidget>

class QLabel;

namespace reminder {
namespace ui {

class NotificationPopup : public QWidget
{
    Q_OBJECT

public:
    NotificationPopup(const QString &title, const QString &description, QWidget *parent = nullptr);

signals:
    void dismissed();

protected:
    void closeEvent(QCloseEvent *event) override;

private:
    QLabel *m_titleLabel = nullptr;
    QLabel *m_descriptionLabel = nullptr;
};

} // namespace ui
} // namespace reminder
