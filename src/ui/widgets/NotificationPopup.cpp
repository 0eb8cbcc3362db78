#include "reminder/ui/widgets/NotificationPopup.hpp"

#include <QCloseEvent>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>

namespace reminder {
namespace ui {

NotificationPopup::NotificationPopup(const QString &title, const QString &description, QWidget *parent)
    : QWidget(parent, Qt::Tool | Qt::WindowStaysOnTopHint)
{
    setAttribute(Qt::WA_DeleteOnClose);
    setWindowTitle(tr("Reminder Alert"));
    setFixedSize(300, 200);

    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(12, 12, 12, 12);
    layout->setSpacing(6);

    auto *bellLabel = new QLabel(QString::fromUtf8("\xF0\x9F\x94\x94"), this);
    QFont bellFont = bellLabel->font();
    bellFont.setPointSize(bellFont.pointSize() * 2);
    bellLabel->setFont(bellFont);
    bellLabel->setAlignment(Qt::AlignCenter);
    layout->addWidget(bellLabel);

    m_titleLabel = new QLabel(tr("Title: %1").arg(title), this);
    m_titleLabel->setObjectName(QStringLiteral("notificationTitle"));
    auto font = m_titleLabel->font();
    font.setBold(true);
    m_titleLabel->setFont(font);
    m_titleLabel->setAlignment(Qt::AlignCenter);
    layout->addWidget(m_titleLabel);

    m_descriptionLabel = new QLabel(description.isEmpty() ? QString() : tr("Description: %1").arg(description), this);
    m_descriptionLabel->setObjectName(QStringLiteral("notificationDescription"));
    m_descriptionLabel->setWordWrap(true);
    m_descriptionLabel->setAlignment(Qt::AlignCenter);
    layout->addWidget(m_descriptionLabel, 1);

    auto *dismissButton = new QPushButton(tr("Dismiss"), this);
    connect(dismissButton, &QPushButton::clicked, this, &QWidget::close);
    layout->addWidget(dismissButton, 0, Qt::AlignHCenter);
}

void NotificationPopup::closeEvent(QCloseEvent *event)
{
    emit dismissed();
    QWidget::closeEvent(event);
}

} // namespace ui
} // namespace reminder
