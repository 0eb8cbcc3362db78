#include <QtTest/QtTest>

#include <QApplication>
#include <QLabel>
#include <QPushButton>
#include <QSignalSpy>

#include "reminder/ui/PopupAlertPresenter.hpp"
#include "reminder/ui/widgets/NotificationPopup.hpp"

using namespace reminder;

namespace {

QList<ui::NotificationPopup *> visiblePopups()
{
    QList<ui::NotificationPopup *> result;
    for (QWidget *widget : QApplication::topLevelWidgets()) {
        if (auto *popup = qobject_cast<ui::NotificationPopup *>(widget); popup && popup->isVisible()) {
            result.append(popup);
        }
    }
    return result;
}

} // namespace

class PopupAlertPresenterTest : public QObject
{
    Q_OBJECT

private slots:
    void presentShowsPopupWithContent();
    void dismissClosesPopup();
    void dismissButtonReleasesHandle();
};

void PopupAlertPresenterTest::presentShowsPopupWithContent()
{
    ui::PopupAlertPresenter presenter;
    QSignalSpy presentedSpy(&presenter, &ui::PopupAlertPresenter::alertPresented);

    const auto handle = presenter.presentAlert(QStringLiteral("Meeting"), QStringLiteral("Room 2"));
    QCOMPARE(presenter.openAlertCount(), 1);
    QCOMPARE(presentedSpy.count(), 1);
    QCOMPARE(presentedSpy.first().at(0).toULongLong(), handle);

    const auto popups = visiblePopups();
    QCOMPARE(popups.size(), 1);
    QStringList texts;
    for (QLabel *label : popups.first()->findChildren<QLabel *>()) {
        texts.append(label->text());
    }
    QVERIFY(texts.contains(QStringLiteral("Title: Meeting")));
    QVERIFY(texts.contains(QStringLiteral("Description: Room 2")));

    presenter.dismiss(handle);
}

void PopupAlertPresenterTest::dismissClosesPopup()
{
    ui::PopupAlertPresenter presenter;
    const auto first = presenter.presentAlert(QStringLiteral("One"), QString());
    const auto second = presenter.presentAlert(QStringLiteral("Two"), QString());
    QVERIFY(first != second);
    QCOMPARE(presenter.openAlertCount(), 2);

    presenter.dismiss(first);
    QCOMPARE(presenter.openAlertCount(), 1);
    presenter.dismiss(first);
    QCOMPARE(presenter.openAlertCount(), 1);

    presenter.dismiss(second);
    QCOMPARE(presenter.openAlertCount(), 0);
    QTRY_VERIFY(visiblePopups().isEmpty());
}

void PopupAlertPresenterTest::dismissButtonReleasesHandle()
{
    ui::PopupAlertPresenter presenter;
    const auto handle = presenter.presentAlert(QStringLiteral("Click me"), QString());
    const auto popups = visiblePopups();
    QCOMPARE(popups.size(), 1);

    auto *button = popups.first()->findChild<QPushButton *>();
    QVERIFY(button);
    QTest::mouseClick(button, Qt::LeftButton);
    QCOMPARE(presenter.openAlertCount(), 0);

    // The auto-dismiss timer may still fire for a closed alert.
    presenter.dismiss(handle);
    QCOMPARE(presenter.openAlertCount(), 0);
}

QTEST_MAIN(PopupAlertPresenterTest)
#include "PopupAlertPresenterTest.moc"
