#include "reminder/ui/PopupAlertPresenter.hpp"

#include <QGuiApplication>
#include <QScreen>

#include "reminder/core/Logging.hpp"
#include "reminder/ui/widgets/NotificationPopup.hpp"

namespace reminder {
namespace ui {

namespace {
constexpr int SCREEN_MARGIN = 16;
}

PopupAlertPresenter::PopupAlertPresenter(QObject *parent)
    : QObject(parent)
{
}

PopupAlertPresenter::~PopupAlertPresenter()
{
    const auto popups = m_popups;
    m_popups.clear();
    for (const auto &popup : popups) {
        if (popup) {
            popup->close();
        }
    }
}

PopupAlertPresenter::AlertHandle PopupAlertPresenter::presentAlert(const QString &title, const QString &description)
{
    const AlertHandle handle = ++m_nextHandle;
    auto *popup = new NotificationPopup(title, description);
    connect(popup, &NotificationPopup::dismissed, this, [this, handle]() { m_popups.remove(handle); });
    m_popups.insert(handle, popup);
    placePopup(popup);
    popup->show();
    popup->raise();
    qCDebug(lcUi) << "alert" << handle << "shown:" << title;
    emit alertPresented(handle, title);
    return handle;
}

void PopupAlertPresenter::dismiss(AlertHandle handle)
{
    const QPointer<NotificationPopup> popup = m_popups.take(handle);
    if (popup) {
        popup->close();
    }
}

int PopupAlertPresenter::openAlertCount() const
{
    return m_popups.size();
}

void PopupAlertPresenter::placePopup(NotificationPopup *popup) const
{
    const QScreen *screen = QGuiApplication::primaryScreen();
    if (!screen) {
        return;
    }
    const QRect area = screen->availableGeometry();
    const int stackOffset = (m_popups.size() - 1) * (popup->height() + SCREEN_MARGIN / 2);
    popup->move(area.right() - popup->width() - SCREEN_MARGIN,
                qMax(area.top(), area.bottom() - popup->height() - SCREEN_MARGIN - stackOffset));
}

} // namespace ui
} // namespace reminder
