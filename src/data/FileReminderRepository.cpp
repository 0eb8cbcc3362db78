#include "reminder/data/FileReminderRepository.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

#include "reminder/core/Logging.hpp"

namespace reminder {
namespace data {

namespace {
constexpr auto DATE_TIME_FORMAT = "yyyy-MM-dd HH:mm";

QUuid parseUid(const QString &value)
{
    QUuid id(value);
    if (id.isNull()) {
        id = QUuid(QStringLiteral("{%1}").arg(value));
    }
    return id;
}
} // namespace

FileReminderRepository::FileReminderRepository(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &FileReminderRepository::filePath() const
{
    return m_filePath;
}

core::Result<std::vector<Reminder>> FileReminderRepository::loadAll()
{
    using LoadResult = core::Result<std::vector<Reminder>>;

    QFile file(m_filePath);
    if (!file.exists()) {
        qCInfo(lcPersistence) << "no reminders file at" << m_filePath << "- starting fresh";
        return LoadResult::success({});
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return LoadResult::failure(core::ErrorKind::PersistenceFailure,
                                   QStringLiteral("Cannot open %1: %2").arg(m_filePath, file.errorString()));
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return LoadResult::failure(core::ErrorKind::PersistenceFailure,
                                   QStringLiteral("Malformed reminders file %1: %2")
                                       .arg(m_filePath, parseError.errorString()));
    }
    if (!document.isArray()) {
        return LoadResult::failure(core::ErrorKind::PersistenceFailure,
                                   QStringLiteral("Reminders file %1 does not contain a list").arg(m_filePath));
    }

    const QJsonArray entries = document.array();
    std::vector<Reminder> reminders;
    reminders.reserve(static_cast<size_t>(entries.size()));
    for (const QJsonValue &entry : entries) {
        auto reminder = fromJson(entry.toObject());
        if (!reminder) {
            qCWarning(lcPersistence) << "skipping malformed reminder entry in" << m_filePath;
            continue;
        }
        reminders.push_back(std::move(*reminder));
    }
    qCInfo(lcPersistence) << "loaded" << reminders.size() << "reminders from" << m_filePath;
    return LoadResult::success(std::move(reminders));
}

std::optional<core::Error> FileReminderRepository::saveAll(const std::vector<Reminder> &reminders)
{
    if (m_filePath.isEmpty()) {
        return core::Error{ core::ErrorKind::PersistenceFailure, QStringLiteral("No storage file configured") };
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return core::Error{ core::ErrorKind::PersistenceFailure,
                            QStringLiteral("Cannot create directory %1").arg(dir.path()) };
    }

    QJsonArray entries;
    for (const Reminder &reminder : reminders) {
        entries.append(toJson(reminder));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return core::Error{ core::ErrorKind::PersistenceFailure,
                            QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString()) };
    }
    file.write(QJsonDocument(entries).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        return core::Error{ core::ErrorKind::PersistenceFailure,
                            QStringLiteral("Cannot commit %1: %2").arg(m_filePath, file.errorString()) };
    }
    return std::nullopt;
}

QJsonObject FileReminderRepository::toJson(const Reminder &reminder)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), reminder.id.toString(QUuid::WithoutBraces));
    object.insert(QStringLiteral("title"), reminder.title);
    object.insert(QStringLiteral("description"), reminder.description);
    object.insert(QStringLiteral("trigger_time"), reminder.triggerTime.toString(QLatin1String(DATE_TIME_FORMAT)));
    object.insert(QStringLiteral("is_active"), reminder.active);
    return object;
}

std::optional<Reminder> FileReminderRepository::fromJson(const QJsonObject &object)
{
    Reminder reminder;
    reminder.title = object.value(QStringLiteral("title")).toString();
    if (reminder.title.trimmed().isEmpty()) {
        return std::nullopt;
    }
    reminder.triggerTime = QDateTime::fromString(object.value(QStringLiteral("trigger_time")).toString(),
                                                 QLatin1String(DATE_TIME_FORMAT));
    if (!reminder.triggerTime.isValid()) {
        return std::nullopt;
    }
    const QUuid id = parseUid(object.value(QStringLiteral("id")).toString());
    if (!id.isNull()) {
        reminder.id = id;
    }
    reminder.description = object.value(QStringLiteral("description")).toString();
    reminder.active = object.value(QStringLiteral("is_active")).toBool(true);
    return reminder;
}

} // namespace data
} // namespace reminder
