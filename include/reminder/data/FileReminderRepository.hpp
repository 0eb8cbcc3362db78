#pragma once

#include <QString>

#include "reminder/data/ReminderRepository.hpp"

class QJsonObject;

namespace reminder {
namespace data {

// Stores reminders as a JSON array:
// [{ "id", "title", "description", "trigger_time": "yyyy-MM-dd HH:mm", "is_active" }]
class FileReminderRepository : public ReminderRepository
{
public:
    explicit FileReminderRepository(QString filePath);
    ~FileReminderRepository() override = default;

    core::Result<std::vector<Reminder>> loadAll() override;
    std::optional<core::Error> saveAll(const std::vector<Reminder> &reminders) override;

    const QString &filePath() const;

private:
    static QJsonObject toJson(const Reminder &reminder);
    static std::optional<Reminder> fromJson(const QJsonObject &object);

    QString m_filePath;
};

} // namespace data
} // namespace reminder
