#include <QtTest/QtTest>

#include <QAtomicInt>
#include <QSignalSpy>
#include <QThread>
#include <memory>
#include <vector>

#include "reminder/data/ReminderStore.hpp"

using namespace reminder::data;

namespace {
Reminder makeReminder(const QString &title, int secondsFromNow)
{
    Reminder reminder;
    reminder.title = title;
    reminder.triggerTime = QDateTime::currentDateTime().addSecs(secondsFromNow);
    return reminder;
}
} // namespace

class ReminderStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void insertAndGet();
    void updateBumpsRevision();
    void updateUnknownIsNotFound();
    void removeReturnsRecord();
    void listAllIsSortedSnapshot();
    void setActiveStatuses();
    void claimFiringOnlyOnce();
    void claimFiringRejectsStaleRevision();
    void concurrentClaimsHaveOneWinner();
    void mutationsEmitChanged();
};

void ReminderStoreTest::insertAndGet()
{
    ReminderStore store;
    Reminder reminder = makeReminder(QStringLiteral("Water plants"), 60);
    reminder.id = QUuid();
    const auto stored = store.insert(reminder);

    QVERIFY(!stored.id.isNull());
    QVERIFY(stored.revision > 0);
    QCOMPARE(store.size(), 1);

    const auto fetched = store.get(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->title, QStringLiteral("Water plants"));
    QVERIFY(fetched->active);
    QVERIFY(!store.get(QUuid::createUuid()).has_value());
}

void ReminderStoreTest::updateBumpsRevision()
{
    ReminderStore store;
    const auto stored = store.insert(makeReminder(QStringLiteral("Initial"), 60));

    Reminder edited = stored;
    edited.title = QStringLiteral("Updated");
    Reminder afterUpdate;
    QCOMPARE(store.update(edited, &afterUpdate), ReminderStore::Status::Ok);
    QVERIFY(afterUpdate.revision > stored.revision);
    QCOMPARE(store.get(stored.id)->title, QStringLiteral("Updated"));
    QCOMPARE(store.get(stored.id)->revision, afterUpdate.revision);
}

void ReminderStoreTest::updateUnknownIsNotFound()
{
    ReminderStore store;
    QCOMPARE(store.update(makeReminder(QStringLiteral("Ghost"), 60)), ReminderStore::Status::NotFound);
    QCOMPARE(store.size(), 0);
}

void ReminderStoreTest::removeReturnsRecord()
{
    ReminderStore store;
    const auto stored = store.insert(makeReminder(QStringLiteral("Pay rent"), 60));

    const auto removed = store.remove(stored.id);
    QVERIFY(removed.has_value());
    QCOMPARE(removed->title, QStringLiteral("Pay rent"));
    QVERIFY(!store.get(stored.id).has_value());
    QVERIFY(!store.remove(stored.id).has_value());
}

void ReminderStoreTest::listAllIsSortedSnapshot()
{
    ReminderStore store;
    store.insert(makeReminder(QStringLiteral("Later"), 600));
    store.insert(makeReminder(QStringLiteral("Sooner"), 60));

    auto snapshot = store.listAll();
    QCOMPARE(snapshot.size(), static_cast<size_t>(2));
    QCOMPARE(snapshot.front().title, QStringLiteral("Sooner"));

    store.insert(makeReminder(QStringLiteral("Third"), 10));
    QCOMPARE(snapshot.size(), static_cast<size_t>(2));
    QCOMPARE(store.listAll().size(), static_cast<size_t>(3));
}

void ReminderStoreTest::setActiveStatuses()
{
    ReminderStore store;
    const auto stored = store.insert(makeReminder(QStringLiteral("Toggle"), 60));

    QCOMPARE(store.setActive(stored.id, false), ReminderStore::Status::Ok);
    QCOMPARE(store.setActive(stored.id, false), ReminderStore::Status::Unchanged);
    QCOMPARE(store.setActive(QUuid::createUuid(), false), ReminderStore::Status::NotFound);

    QCOMPARE(store.setActive(stored.id, true), ReminderStore::Status::Ok);
    QVERIFY(store.get(stored.id)->revision > stored.revision);
}

void ReminderStoreTest::claimFiringOnlyOnce()
{
    ReminderStore store;
    const auto stored = store.insert(makeReminder(QStringLiteral("Once"), -1));

    int callbacks = 0;
    const auto first = store.claimFiring(stored.id, stored.revision, [&](const Reminder &) { ++callbacks; });
    QVERIFY(first.has_value());
    QVERIFY(!first->active);
    QVERIFY(!store.get(stored.id)->active);

    const auto second = store.claimFiring(stored.id, stored.revision, [&](const Reminder &) { ++callbacks; });
    QVERIFY(!second.has_value());
    QCOMPARE(callbacks, 1);

    store.remove(stored.id);
    QVERIFY(!store.claimFiring(stored.id, stored.revision).has_value());
}

void ReminderStoreTest::claimFiringRejectsStaleRevision()
{
    ReminderStore store;
    const auto stored = store.insert(makeReminder(QStringLiteral("Moved"), 60));
    Reminder edited = stored;
    edited.triggerTime = edited.triggerTime.addSecs(3600);
    Reminder afterUpdate;
    QCOMPARE(store.update(edited, &afterUpdate), ReminderStore::Status::Ok);

    QVERIFY(!store.claimFiring(stored.id, stored.revision).has_value());
    QVERIFY(store.get(stored.id)->active);
    QVERIFY(store.claimFiring(stored.id, afterUpdate.revision).has_value());
}

void ReminderStoreTest::concurrentClaimsHaveOneWinner()
{
    ReminderStore store;
    const auto stored = store.insert(makeReminder(QStringLiteral("Race"), -1));

    QAtomicInt winners;
    QAtomicInt callbacks;
    std::vector<std::unique_ptr<QThread>> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back(QThread::create([&]() {
            if (store.claimFiring(stored.id, stored.revision, [&](const Reminder &) { callbacks.ref(); })) {
                winners.ref();
            }
        }));
    }
    for (auto &thread : threads) {
        thread->start();
    }
    for (auto &thread : threads) {
        QVERIFY(thread->wait(5000));
    }
    QCOMPARE(winners.loadAcquire(), 1);
    QCOMPARE(callbacks.loadAcquire(), 1);
}

void ReminderStoreTest::mutationsEmitChanged()
{
    ReminderStore store;
    QSignalSpy changedSpy(&store, &ReminderStore::changed);
    QSignalSpy removedSpy(&store, &ReminderStore::reminderRemoved);

    const auto stored = store.insert(makeReminder(QStringLiteral("Signals"), 60));
    store.setActive(stored.id, false);
    store.setActive(stored.id, false);
    store.remove(stored.id);
    store.remove(stored.id);

    QCOMPARE(changedSpy.count(), 3);
    QCOMPARE(removedSpy.count(), 1);
    QCOMPARE(removedSpy.first().first().toUuid(), stored.id);
}

QTEST_GUILESS_MAIN(ReminderStoreTest)
#include "ReminderStoreTest.moc"
