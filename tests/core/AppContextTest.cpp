#include <QtTest/QtTest>

#include <QElapsedTimer>

#include "reminder/audio/SoundPlayer.hpp"
#include "reminder/core/AppContext.hpp"
#include "reminder/core/ReminderService.hpp"
#include "reminder/data/InMemoryReminderRepository.hpp"
#include "reminder/data/ReminderStore.hpp"
#include "reminder/scheduling/AlertPresenter.hpp"
#include "reminder/scheduling/NotificationDispatcher.hpp"
#include "reminder/scheduling/NotificationQueue.hpp"
#include "reminder/scheduling/SchedulerSupervisor.hpp"

using namespace reminder;

namespace {

class CountingPresenter : public scheduling::AlertPresenter
{
public:
    AlertHandle presentAlert(const QString &title, const QString &) override
    {
        titles.append(title);
        return static_cast<AlertHandle>(titles.size());
    }
    void dismiss(AlertHandle) override { ++dismissed; }

    QStringList titles;
    int dismissed = 0;
};

class SilentPlayer : public audio::SoundPlayer
{
public:
    void playAsync(const QString &) override { plays.fetchAndAddOrdered(1); }
    void stopAll() override { stopped = true; }

    QAtomicInt plays;
    bool stopped = false;
};

core::AppSettings testSettings()
{
    core::AppSettings settings = core::AppSettings::defaults();
    settings.pollIntervalMs = 50;
    settings.alertDurationMs = 100;
    settings.soundFile = QStringLiteral("chime.wav");
    settings.shutdownTimeoutMs = 2000;
    return settings;
}

core::ReminderFields dueIn(int ms, const QString &title)
{
    core::ReminderFields fields;
    fields.title = title;
    fields.triggerTime = QDateTime::currentDateTime().addMSecs(ms);
    return fields;
}

} // namespace

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void deliversFiredReminders();
    void deliversInTriggerOrder();
    void shutdownStopsWorkersAndFlushes();
};

void AppContextTest::deliversFiredReminders()
{
    auto repository = std::make_unique<data::InMemoryReminderRepository>();
    auto *repo = repository.get();
    core::AppContext context(testSettings(), std::move(repository));
    CountingPresenter presenter;
    SilentPlayer player;
    QObject uiContext;
    context.startDelivery(presenter, player, &uiContext);
    QVERIFY(context.dispatcher());

    QVERIFY(context.reminderService().addReminder(dueIn(150, QStringLiteral("Ping"))).ok());

    QTRY_COMPARE(presenter.titles.size(), 1);
    QCOMPARE(presenter.titles.first(), QStringLiteral("Ping"));
    QCOMPARE(player.plays.loadAcquire(), 1);
    QTRY_COMPARE(presenter.dismissed, 1);

    // The fired reminder is persisted as expired.
    QTRY_VERIFY(!repo->saved().empty() && !repo->saved().front().active);
    QVERIFY(context.shutdown());
}

void AppContextTest::deliversInTriggerOrder()
{
    core::AppContext context(testSettings(), std::make_unique<data::InMemoryReminderRepository>());
    CountingPresenter presenter;
    SilentPlayer player;
    QObject uiContext;
    context.startDelivery(presenter, player, &uiContext);

    QVERIFY(context.reminderService().addReminder(dueIn(400, QStringLiteral("Second"))).ok());
    QVERIFY(context.reminderService().addReminder(dueIn(150, QStringLiteral("First"))).ok());

    QTRY_COMPARE(presenter.titles.size(), 2);
    QCOMPARE(presenter.titles, QStringList({ QStringLiteral("First"), QStringLiteral("Second") }));
    QVERIFY(context.shutdown());
}

void AppContextTest::shutdownStopsWorkersAndFlushes()
{
    auto repository = std::make_unique<data::InMemoryReminderRepository>();
    auto *repo = repository.get();
    core::AppContext context(testSettings(), std::move(repository));
    CountingPresenter presenter;
    SilentPlayer player;
    QObject uiContext;
    context.startDelivery(presenter, player, &uiContext);

    for (int i = 0; i < 3; ++i) {
        QVERIFY(context.reminderService().addReminder(dueIn(60000, QStringLiteral("Later %1").arg(i))).ok());
    }
    QCOMPARE(context.supervisor().monitorCount(), 3);

    QElapsedTimer timer;
    timer.start();
    QVERIFY(context.shutdown());
    QVERIFY(timer.elapsed() < 2000);

    QVERIFY(context.supervisor().isShutDown());
    QCOMPARE(context.supervisor().monitorCount(), 0);
    QVERIFY(!context.dispatcher()->isRunning());
    QVERIFY(player.stopped);
    QCOMPARE(repo->saved().size(), static_cast<size_t>(3));

    // Second call is a no-op and nothing can be scheduled afterwards.
    QVERIFY(context.shutdown());
    const auto late = context.reminderService().addReminder(dueIn(60000, QStringLiteral("Too late")));
    QVERIFY(late.ok());
    QCOMPARE(context.supervisor().monitorCount(), 0);
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
