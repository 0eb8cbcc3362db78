#pragma once

#include <QString>
#include <QtGlobal>

namespace reminder {
namespace scheduling {

// Visual alerts. Only ever called on the UI thread.
class AlertPresenter
{
public:
    using AlertHandle = quint64;

    virtual ~AlertPresenter() = default;

    virtual AlertHandle presentAlert(const QString &title, const QString &description) = 0;
    // Dismissing an alert that is already gone is a no-op.
    virtual void dismiss(AlertHandle handle) = 0;
};

} // namespace scheduling
} // namespace reminder
