#include <QtTest/QtTest>

#include <QElapsedTimer>
#include <QThread>
#include <memory>

#include "reminder/data/ReminderStore.hpp"
#include "reminder/scheduling/NotificationQueue.hpp"
#include "reminder/scheduling/ReminderMonitor.hpp"

using namespace reminder;
using Outcome = scheduling::ReminderMonitor::Outcome;

namespace {

data::Reminder dueIn(int ms, const QString &title = QStringLiteral("Tea"))
{
    data::Reminder reminder;
    reminder.title = title;
    reminder.description = QStringLiteral("Kettle is on");
    reminder.triggerTime = QDateTime::currentDateTime().addMSecs(ms);
    return reminder;
}

} // namespace

class ReminderMonitorTest : public QObject
{
    Q_OBJECT

private slots:
    void firesOnceAtTriggerTime();
    void pastDueFiresImmediately();
    void cancelStopsBeforeFiring();
    void removedReminderDoesNotFire();
    void supersededRevisionDoesNotFire();
    void outcomeNames();
};

void ReminderMonitorTest::firesOnceAtTriggerTime()
{
    data::ReminderStore store;
    scheduling::NotificationQueue queue;
    const auto stored = store.insert(dueIn(200));

    scheduling::ReminderMonitor monitor(store, queue, stored, core::CancellationToken(), 50);
    QElapsedTimer timer;
    timer.start();
    QCOMPARE(monitor.run(), Outcome::Fired);
    QVERIFY(timer.elapsed() >= 150);

    const auto event = queue.tryPop();
    QVERIFY(event.has_value());
    QCOMPARE(event->title, stored.title);
    QCOMPARE(event->description, stored.description);
    QVERIFY(event->firedAt.isValid());
    QVERIFY(!queue.tryPop().has_value());
    QVERIFY(!store.get(stored.id)->active);

    // A second monitor for the same revision finds nothing to fire.
    scheduling::ReminderMonitor again(store, queue, stored, core::CancellationToken(), 50);
    QCOMPARE(again.run(), Outcome::Cancelled);
    QCOMPARE(queue.size(), 0);
}

void ReminderMonitorTest::pastDueFiresImmediately()
{
    data::ReminderStore store;
    scheduling::NotificationQueue queue;
    const auto stored = store.insert(dueIn(-60000));

    scheduling::ReminderMonitor monitor(store, queue, stored, core::CancellationToken(), 1000);
    QElapsedTimer timer;
    timer.start();
    QCOMPARE(monitor.run(), Outcome::Fired);
    QVERIFY(timer.elapsed() < 500);
    QCOMPARE(queue.size(), 1);
}

void ReminderMonitorTest::cancelStopsBeforeFiring()
{
    data::ReminderStore store;
    scheduling::NotificationQueue queue;
    const auto stored = store.insert(dueIn(60000));

    core::CancellationToken token;
    scheduling::ReminderMonitor monitor(store, queue, stored, token, 1000);
    Outcome outcome = Outcome::Faulted;
    std::unique_ptr<QThread> thread(QThread::create([&]() { outcome = monitor.run(); }));
    thread->start();

    QThread::msleep(50);
    QElapsedTimer timer;
    timer.start();
    token.cancel();
    QVERIFY(thread->wait(2000));
    QVERIFY(timer.elapsed() < 1000);
    QCOMPARE(outcome, Outcome::Cancelled);
    QCOMPARE(queue.size(), 0);
    QVERIFY(store.get(stored.id)->active);
}

void ReminderMonitorTest::removedReminderDoesNotFire()
{
    data::ReminderStore store;
    scheduling::NotificationQueue queue;
    const auto stored = store.insert(dueIn(150));

    scheduling::ReminderMonitor monitor(store, queue, stored, core::CancellationToken(), 20);
    Outcome outcome = Outcome::Faulted;
    std::unique_ptr<QThread> thread(QThread::create([&]() { outcome = monitor.run(); }));
    thread->start();

    QVERIFY(store.remove(stored.id).has_value());
    QVERIFY(thread->wait(2000));
    QCOMPARE(outcome, Outcome::Cancelled);
    QCOMPARE(queue.size(), 0);
}

void ReminderMonitorTest::supersededRevisionDoesNotFire()
{
    data::ReminderStore store;
    scheduling::NotificationQueue queue;
    const auto original = store.insert(dueIn(150, QStringLiteral("Old title")));

    auto edited = original;
    edited.title = QStringLiteral("New title");
    edited.triggerTime = QDateTime::currentDateTime().addSecs(3600);
    data::Reminder stored;
    QCOMPARE(store.update(edited, &stored), data::ReminderStore::Status::Ok);
    QVERIFY(stored.revision != original.revision);

    scheduling::ReminderMonitor monitor(store, queue, original, core::CancellationToken(), 20);
    QCOMPARE(monitor.run(), Outcome::Cancelled);
    QCOMPARE(queue.size(), 0);
    QVERIFY(store.get(original.id)->active);
}

void ReminderMonitorTest::outcomeNames()
{
    QCOMPARE(scheduling::outcomeName(Outcome::Fired), QStringLiteral("fired"));
    QCOMPARE(scheduling::outcomeName(Outcome::Cancelled), QStringLiteral("cancelled"));
    QCOMPARE(scheduling::outcomeName(Outcome::Faulted), QStringLiteral("faulted"));
}

QTEST_GUILESS_MAIN(ReminderMonitorTest)
#include "ReminderMonitorTest.moc"
