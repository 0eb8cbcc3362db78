#pragma once

#include <QHash>
#include <QObject>
#include <QPointer>

#include "reminder/scheduling/AlertPresenter.hpp"

namespace reminder {
namespace ui {

class NotificationPopup;

class PopupAlertPresenter : public QObject, public scheduling::AlertPresenter
{
    Q_OBJECT

public:
    explicit PopupAlertPresenter(QObject *parent = nullptr);
    ~PopupAlertPresenter() override;

    AlertHandle presentAlert(const QString &title, const QString &description) override;
    void dismiss(AlertHandle handle) override;

    int openAlertCount() const;

signals:
    void alertPresented(quint64 handle, const QString &title);

private:
    void placePopup(NotificationPopup *popup) const;

    QHash<AlertHandle, QPointer<NotificationPopup>> m_popups;
    AlertHandle m_nextHandle = 0;
};

} // namespace ui
} // namespace reminder
