#include <QtTest/QtTest>

#include <QElapsedTimer>
#include <QThread>
#include <memory>

#include "reminder/core/CancellationToken.hpp"

using reminder::core::CancellationToken;

class CancellationTokenTest : public QObject
{
    Q_OBJECT

private slots:
    void waitTimesOutWhenNotCancelled();
    void cancelWakesWaiter();
    void childFollowsParent();
    void childCancelLeavesParentRunning();
    void childOfCancelledParentStartsCancelled();
};

void CancellationTokenTest::waitTimesOutWhenNotCancelled()
{
    CancellationToken token;
    QElapsedTimer timer;
    timer.start();
    QVERIFY(!token.waitFor(50));
    QVERIFY(timer.elapsed() >= 40);
    QVERIFY(!token.isCancelled());
}

void CancellationTokenTest::cancelWakesWaiter()
{
    CancellationToken token;
    bool observed = false;
    qint64 waitedMs = 0;
    std::unique_ptr<QThread> waiter(QThread::create([&]() {
        QElapsedTimer timer;
        timer.start();
        observed = token.waitFor(10000);
        waitedMs = timer.elapsed();
    }));
    waiter->start();
    QThread::msleep(50);
    token.cancel();
    QVERIFY(waiter->wait(5000));
    QVERIFY(observed);
    QVERIFY(waitedMs < 5000);
}

void CancellationTokenTest::childFollowsParent()
{
    CancellationToken parent;
    CancellationToken first = parent.createChild();
    CancellationToken second = parent.createChild();
    QVERIFY(!first.isCancelled());

    parent.cancel();
    QVERIFY(first.isCancelled());
    QVERIFY(second.isCancelled());
    QVERIFY(first.waitFor(1000));
}

void CancellationTokenTest::childCancelLeavesParentRunning()
{
    CancellationToken parent;
    CancellationToken child = parent.createChild();
    CancellationToken sibling = parent.createChild();
    child.cancel();
    QVERIFY(child.isCancelled());
    QVERIFY(!parent.isCancelled());
    QVERIFY(!sibling.isCancelled());
}

void CancellationTokenTest::childOfCancelledParentStartsCancelled()
{
    CancellationToken parent;
    parent.cancel();
    QVERIFY(parent.createChild().isCancelled());
}

QTEST_GUILESS_MAIN(CancellationTokenTest)
#include "CancellationTokenTest.moc"
