#pragma once

#include <QAtomicInt>
#include <QObject>
#include <QString>

namespace reminder {
namespace data {

class ReminderRepository;
class ReminderStore;

// Writes store snapshots through the repository. Lives on its own thread;
// requestSave() may be called from any thread and never blocks.
class PersistenceWriter : public QObject
{
    Q_OBJECT

public:
    PersistenceWriter(ReminderStore &store, ReminderRepository &repository, QObject *parent = nullptr);
    ~PersistenceWriter() override;

    void requestSave();
    bool hasPendingSave() const;
    int completedSaves() const;

public slots:
    // Runs on the writer's thread, or directly once that thread has stopped.
    void writeSnapshot();

signals:
    void saved();
    void saveFailed(const QString &message);

private:
    ReminderStore &m_store;
    ReminderRepository &m_repository;
    QAtomicInt m_pending;
    QAtomicInt m_completed;
};

} // namespace data
} // namespace reminder
