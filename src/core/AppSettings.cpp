#include "reminder/core/AppSettings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

namespace reminder {
namespace core {

namespace {
constexpr int MIN_POLL_INTERVAL_MS = 10;
constexpr int MAX_POLL_INTERVAL_MS = 1000;

QString dataFolder()
{
    QString folder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (folder.isEmpty()) {
        folder = QDir::homePath() + QStringLiteral("/.local/share/reminder-desk");
    }
    return folder;
}
} // namespace

AppSettings AppSettings::defaults()
{
    AppSettings settings;
    const QDir dir(dataFolder());
    settings.storageFilePath = dir.filePath(QStringLiteral("reminders.json"));
    settings.soundFile = dir.filePath(QStringLiteral("notification_sound.wav"));
    return settings;
}

AppSettings AppSettings::load(QSettings &settings)
{
    AppSettings result = defaults();
    result.storageFilePath = settings.value(QStringLiteral("storage/filePath"), result.storageFilePath).toString();
    result.pollIntervalMs = qBound(MIN_POLL_INTERVAL_MS,
                                   settings.value(QStringLiteral("scheduling/pollIntervalMs"), result.pollIntervalMs).toInt(),
                                   MAX_POLL_INTERVAL_MS);
    result.alertDurationMs = qMax(0, settings.value(QStringLiteral("notifications/alertDurationMs"), result.alertDurationMs).toInt());
    result.soundFile = settings.value(QStringLiteral("notifications/soundFile"), result.soundFile).toString();
    result.soundEnabled = settings.value(QStringLiteral("notifications/soundEnabled"), result.soundEnabled).toBool();
    result.shutdownTimeoutMs = qMax(0, settings.value(QStringLiteral("shutdown/timeoutMs"), result.shutdownTimeoutMs).toInt());
    return result;
}

void AppSettings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("storage/filePath"), storageFilePath);
    settings.setValue(QStringLiteral("scheduling/pollIntervalMs"), pollIntervalMs);
    settings.setValue(QStringLiteral("notifications/alertDurationMs"), alertDurationMs);
    settings.setValue(QStringLiteral("notifications/soundFile"), soundFile);
    settings.setValue(QStringLiteral("notifications/soundEnabled"), soundEnabled);
    settings.setValue(QStringLiteral("shutdown/timeoutMs"), shutdownTimeoutMs);
}

} // namespace core
} // namespace reminder
