#include "reminder/data/PersistenceWriter.hpp"

#include "reminder/core/Logging.hpp"
#include "reminder/data/ReminderRepository.hpp"
#include "reminder/data/ReminderStore.hpp"

namespace reminder {
namespace data {

PersistenceWriter::PersistenceWriter(ReminderStore &store, ReminderRepository &repository, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_repository(repository)
{
}

PersistenceWriter::~PersistenceWriter() = default;

void PersistenceWriter::requestSave()
{
    // Coalesce bursts of mutations into one write.
    if (!m_pending.testAndSetOrdered(0, 1)) {
        return;
    }
    QMetaObject::invokeMethod(this, &PersistenceWriter::writeSnapshot, Qt::QueuedConnection);
}

bool PersistenceWriter::hasPendingSave() const
{
    return m_pending.loadAcquire() != 0;
}

int PersistenceWriter::completedSaves() const
{
    return m_completed.loadAcquire();
}

void PersistenceWriter::writeSnapshot()
{
    m_pending.storeRelease(0);
    const auto snapshot = m_store.listAll();
    const auto error = m_repository.saveAll(snapshot);
    m_completed.fetchAndAddOrdered(1);
    if (error) {
        qCWarning(lcPersistence) << core::errorKindName(error->kind) << error->message;
        emit saveFailed(error->message);
        return;
    }
    qCDebug(lcPersistence) << "saved" << snapshot.size() << "reminders";
    emit saved();
}

} // namespace data
} // namespace reminder
