#pragma once

#include <QString>

class QSettings;

namespace reminder {
namespace core {

struct AppSettings
{
    QString storageFilePath;
    int pollIntervalMs = 1000;
    int alertDurationMs = 5000;
    QString soundFile;
    bool soundEnabled = true;
    int shutdownTimeoutMs = 3000;

    static AppSettings defaults();
    static AppSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace reminder
