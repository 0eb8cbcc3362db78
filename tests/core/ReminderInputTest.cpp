#include <QtTest/QtTest>

#include "reminder/core/ReminderInput.hpp"

using namespace reminder;

class ReminderInputTest : public QObject
{
    Q_OBJECT

private slots:
    void acceptsValidDraft();
    void rejectsEmptyTitle();
    void rejectsMalformedTime_data();
    void rejectsMalformedTime();
    void rejectsPastInstant();
    void draftRoundTripsReminderFields();
};

namespace {
const QDateTime kNow(QDate(2024, 5, 10), QTime(12, 0));
}

void ReminderInputTest::acceptsValidDraft()
{
    core::ReminderDraft draft;
    draft.title = QStringLiteral("  Call Anna  ");
    draft.description = QStringLiteral("About the trip\n");
    draft.date = QDate(2024, 5, 10);
    draft.timeText = QStringLiteral("13:45");

    const auto result = core::parseDraft(draft, kNow);
    QVERIFY(result.ok());
    QCOMPARE(result.value().title, QStringLiteral("Call Anna"));
    QCOMPARE(result.value().description, QStringLiteral("About the trip"));
    QCOMPARE(result.value().triggerTime, QDateTime(QDate(2024, 5, 10), QTime(13, 45)));
}

void ReminderInputTest::rejectsEmptyTitle()
{
    core::ReminderDraft draft;
    draft.title = QStringLiteral("   ");
    draft.date = QDate(2024, 5, 11);
    draft.timeText = QStringLiteral("09:00");

    const auto result = core::parseDraft(draft, kNow);
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, core::ErrorKind::InvalidInput);
    QCOMPARE(result.error().message, QStringLiteral("Title cannot be empty"));
}

void ReminderInputTest::rejectsMalformedTime_data()
{
    QTest::addColumn<QString>("timeText");
    QTest::newRow("empty") << QString();
    QTest::newRow("letters") << QStringLiteral("ab:cd");
    QTest::newRow("hour out of range") << QStringLiteral("25:00");
    QTest::newRow("minute out of range") << QStringLiteral("10:61");
    QTest::newRow("no separator") << QStringLiteral("1030");
}

void ReminderInputTest::rejectsMalformedTime()
{
    QFETCH(QString, timeText);
    core::ReminderDraft draft;
    draft.title = QStringLiteral("Stretch");
    draft.date = QDate(2024, 5, 11);
    draft.timeText = timeText;

    const auto result = core::parseDraft(draft, kNow);
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, core::ErrorKind::InvalidInput);
    QCOMPARE(result.error().message, QStringLiteral("Invalid time format. Use HH:MM (24-hour)"));
}

void ReminderInputTest::rejectsPastInstant()
{
    core::ReminderDraft draft;
    draft.title = QStringLiteral("Too late");
    draft.date = QDate(2024, 5, 10);
    draft.timeText = QStringLiteral("11:59");

    const auto result = core::parseDraft(draft, kNow);
    QVERIFY(!result.ok());
    QCOMPARE(result.error().message, QStringLiteral("You cannot set a reminder in the past."));
}

void ReminderInputTest::draftRoundTripsReminderFields()
{
    data::Reminder reminder;
    reminder.title = QStringLiteral("Dentist");
    reminder.description = QStringLiteral("Bring card");
    reminder.triggerTime = QDateTime(QDate(2024, 6, 1), QTime(8, 5));

    const auto draft = core::draftFromReminder(reminder);
    QCOMPARE(draft.timeText, QStringLiteral("08:05"));
    QCOMPARE(draft.date, QDate(2024, 6, 1));

    const auto parsed = core::parseDraft(draft, kNow);
    QVERIFY(parsed.ok());
    QCOMPARE(parsed.value().triggerTime, reminder.triggerTime);
}

QTEST_GUILESS_MAIN(ReminderInputTest)
#include "ReminderInputTest.moc"
