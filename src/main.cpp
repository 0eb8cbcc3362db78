#include <QApplication>
#include <QCoreApplication>
#include <QSettings>
#include <QString>

#include "version.h"

#include "reminder/core/AppSettings.hpp"
#include "reminder/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Reminder Desk"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("reminder-desk.local"));
    QCoreApplication::setApplicationName(QStringLiteral("Reminder Desk"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kReminderDeskVersion));

    QApplication app(argc, argv);

    QSettings settings;
    const auto appSettings = reminder::core::AppSettings::load(settings);

    reminder::ui::MainWindow mainWindow(appSettings);
    mainWindow.setWindowTitle(QObject::tr("Reminder App %1").arg(QString::fromLatin1(kReminderDeskVersion)));
    mainWindow.show();

    return app.exec();
}
