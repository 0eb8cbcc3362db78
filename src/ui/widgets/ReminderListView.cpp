#include "reminder/ui/widgets/ReminderListView.hpp"

#include <QKeyEvent>
#include <QPainter>
#include <QStyledItemDelegate>

#include "reminder/ui/models/ReminderListModel.hpp"

namespace reminder {
namespace ui {

namespace {
constexpr int CARD_MARGIN = 6;
constexpr int CARD_PADDING = 10;

class ReminderCardDelegate : public QStyledItemDelegate
{
public:
    using QStyledItemDelegate::QStyledItemDelegate;

    void paint(QPainter *painter, const QStyleOptionViewItem &option, const QModelIndex &index) const override
    {
        painter->save();
        const QRect card = option.rect.adjusted(CARD_MARGIN, CARD_MARGIN / 2, -CARD_MARGIN, -CARD_MARGIN / 2);
        const bool selected = option.state & QStyle::State_Selected;
        painter->setRenderHint(QPainter::Antialiasing);
        painter->setPen(option.palette.color(QPalette::Mid));
        painter->setBrush(selected ? option.palette.highlight() : option.palette.base());
        painter->drawRoundedRect(card, 4, 4);

        const QColor textColor = selected ? option.palette.color(QPalette::HighlightedText)
                                          : option.palette.color(QPalette::Text);
        const QRect content = card.adjusted(CARD_PADDING, CARD_PADDING, -CARD_PADDING, -CARD_PADDING);
        const QFontMetrics metrics(option.font);
        const int lineHeight = metrics.height();

        QFont titleFont = option.font;
        titleFont.setBold(true);
        painter->setFont(titleFont);
        painter->setPen(textColor);
        painter->drawText(QRect(content.left(), content.top(), content.width(), lineHeight),
                          Qt::AlignLeft | Qt::AlignVCenter,
                          QFontMetrics(titleFont).elidedText(index.data(Qt::DisplayRole).toString(), Qt::ElideRight,
                                                             content.width()));

        painter->setFont(option.font);
        const bool active = index.data(ReminderListModel::ActiveRole).toBool();
        painter->setPen(active || selected ? textColor : option.palette.color(QPalette::Disabled, QPalette::Text));
        painter->drawText(QRect(content.left(), content.top() + lineHeight, content.width(), lineHeight),
                          Qt::AlignLeft | Qt::AlignVCenter,
                          index.data(ReminderListModel::ScheduleTextRole).toString());

        const QString description = index.data(Qt::ToolTipRole).toString();
        if (!description.isEmpty()) {
            painter->setPen(textColor);
            painter->drawText(QRect(content.left(), content.top() + 2 * lineHeight, content.width(), lineHeight),
                              Qt::AlignLeft | Qt::AlignVCenter,
                              metrics.elidedText(description.simplified(), Qt::ElideRight, content.width()));
        }
        painter->restore();
    }

    QSize sizeHint(const QStyleOptionViewItem &option, const QModelIndex &) const override
    {
        const int lineHeight = QFontMetrics(option.font).height();
        return QSize(option.rect.width(), 3 * lineHeight + 2 * CARD_PADDING + CARD_MARGIN);
    }
};
} // namespace

ReminderListView::ReminderListView(QWidget *parent)
    : QListView(parent)
{
    setItemDelegate(new ReminderCardDelegate(this));
    setSelectionMode(QAbstractItemView::SingleSelection);
    setVerticalScrollMode(QAbstractItemView::ScrollPerPixel);
    setUniformItemSizes(true);

    connect(this, &QListView::doubleClicked, this, [this](const QModelIndex &index) {
        const QUuid id = index.data(ReminderListModel::IdRole).toUuid();
        if (!id.isNull()) {
            emit editRequested(id);
        }
    });
}

QUuid ReminderListView::currentReminderId() const
{
    const QModelIndex index = currentIndex();
    if (!index.isValid()) {
        return {};
    }
    return index.data(ReminderListModel::IdRole).toUuid();
}

void ReminderListView::keyPressEvent(QKeyEvent *event)
{
    const QUuid id = currentReminderId();
    if (!id.isNull()) {
        if (event->key() == Qt::Key_Delete) {
            emit removeRequested(id);
            event->accept();
            return;
        }
        if (event->key() == Qt::Key_Return || event->key() == Qt::Key_Enter) {
            emit editRequested(id);
            event->accept();
            return;
        }
    }
    QListView::keyPressEvent(event);
}

} // namespace ui
} // namespace reminder
