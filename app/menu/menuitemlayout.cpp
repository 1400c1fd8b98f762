#include "menuitemlayout.h"
#include "selectionindicator.h"
#include "textscale.h"

#include <QFontMetricsF>

namespace PullDown {

namespace {

// Full rows; the start inset shrinks when the checkmark column is shown
const QMarginsF kItemPadding(16, 10.5, 18, 11.5);
const QMarginsF kSelectableItemPadding(13, 10.5, 18, 11.5);

// Action row cells
const QMarginsF kIconActionPadding(8, 8, 8, 8);

const qreal kStandardTitleSpacing = 4;
const qreal kTrailingIconSpacing = 8;
const qreal kCheckmarkSpacing = 3;

const QChar kEllipsis(0x2026);

}

const LayoutElement* MenuItemLayout::element(LayoutRole role) const
{
    for (const auto& e : elements) {
        if (e.role == role)
            return &e;
    }
    return nullptr;
}

QStringList VariantLayoutSelector::truncateTitle(const QString& title, const QFontMetricsF& metrics,
                                                 qreal width, int maxLines)
{
    QStringList lines;
    if (maxLines <= 0)
        return lines;

    const QStringList source = title.split(QLatin1Char('\n'));
    const int kept = qMin(int(source.size()), maxLines);
    for (int i = 0; i < kept; i++) {
        lines << metrics.elidedText(source[i], Qt::ElideRight, width);
    }

    if (source.size() > maxLines && !lines.last().endsWith(kEllipsis)) {
        lines.last() = metrics.elidedText(source[kept - 1] + kEllipsis, Qt::ElideRight, width);
    }

    return lines;
}

MenuItemLayout VariantLayoutSelector::buildLayout(SizeClassification classification,
                                                  const MenuItemSpec& spec,
                                                  const ResolvedItemStyle& style,
                                                  bool selectionVisible,
                                                  qreal width,
                                                  qreal textScaleFactor)
{
    switch (classification) {
    case SizeClassification::Compact:
        return buildCompact(spec, style, width, textScaleFactor);
    case SizeClassification::Standard:
        return buildStandard(spec, style, width, textScaleFactor);
    case SizeClassification::Full:
        return buildFull(spec, style, selectionVisible, width, textScaleFactor);
    }
    return buildFull(spec, style, selectionVisible, width, textScaleFactor);
}

MenuItemLayout VariantLayoutSelector::buildCompact(const MenuItemSpec&, const ResolvedItemStyle& style,
                                                   qreal width, qreal textScaleFactor)
{
    MenuItemLayout layout;
    layout.variant = SizeClassification::Compact;
    layout.padding = kIconActionPadding;
    layout.textScaleFactor = textScaleFactor;
    layout.largeTextScale = TextScale::isLargeTextScale(textScaleFactor);
    layout.iconSize = style.iconSize() * textScaleFactor;

    const qreal height = layout.iconSize + kIconActionPadding.top() + kIconActionPadding.bottom();
    layout.size = QSizeF(width, height);

    LayoutElement icon;
    icon.role = LayoutRole::Icon;
    icon.alignment = Qt::AlignCenter;
    icon.rect = QRectF((width - layout.iconSize) / 2, kIconActionPadding.top(),
                       layout.iconSize, layout.iconSize);
    layout.elements.push_back(icon);

    return layout;
}

MenuItemLayout VariantLayoutSelector::buildStandard(const MenuItemSpec& spec, const ResolvedItemStyle& style,
                                                    qreal width, qreal textScaleFactor)
{
    MenuItemLayout layout;
    layout.variant = SizeClassification::Standard;
    layout.padding = kIconActionPadding;
    layout.textScaleFactor = textScaleFactor;
    layout.largeTextScale = TextScale::isLargeTextScale(textScaleFactor);
    layout.iconSize = style.iconSize() * textScaleFactor;
    layout.maxLines = 1;

    const MenuTextStyle textStyle = style.iconActionTextStyle().scaled(textScaleFactor);
    const qreal lineHeight = textStyle.lineBoxHeight();
    const qreal contentWidth = qMax<qreal>(0, width - kIconActionPadding.left() - kIconActionPadding.right());

    LayoutElement icon;
    icon.role = LayoutRole::Icon;
    icon.alignment = Qt::AlignCenter;
    icon.rect = QRectF((width - layout.iconSize) / 2, kIconActionPadding.top(),
                       layout.iconSize, layout.iconSize);
    layout.elements.push_back(icon);

    LayoutElement title;
    title.role = LayoutRole::Title;
    title.alignment = Qt::AlignHCenter | Qt::AlignVCenter;
    title.rect = QRectF(kIconActionPadding.left(), icon.rect.bottom() + kStandardTitleSpacing,
                        contentWidth, lineHeight);
    title.lines = truncateTitle(spec.title, QFontMetricsF(textStyle.font()), contentWidth, 1);
    layout.elements.push_back(title);

    layout.size = QSizeF(width, title.rect.bottom() + kIconActionPadding.bottom());
    return layout;
}

MenuItemLayout VariantLayoutSelector::buildFull(const MenuItemSpec& spec, const ResolvedItemStyle& style,
                                                bool selectionVisible, qreal width, qreal textScaleFactor)
{
    MenuItemLayout layout;
    layout.variant = SizeClassification::Full;
    layout.padding = selectionVisible ? kSelectableItemPadding : kItemPadding;
    layout.textScaleFactor = textScaleFactor;
    layout.largeTextScale = TextScale::isLargeTextScale(textScaleFactor);
    layout.maxLines = TextScale::titleLineLimit(textScaleFactor);
    layout.iconSize = style.iconSize() * textScaleFactor;

    const MenuTextStyle textStyle = style.textStyle().scaled(textScaleFactor);
    const qreal lineHeight = textStyle.lineBoxHeight();
    const QMarginsF& padding = layout.padding;

    qreal titleLeft = padding.left();
    qreal titleRight = width - padding.right();

    LayoutElement checkmark;
    if (selectionVisible) {
        const SelectionIndicator indicator(spec.selected.value_or(false), style.checkmark(),
                                           style.checkmarkWeight(), style.checkmarkSize());
        checkmark.role = LayoutRole::Checkmark;
        checkmark.alignment = Qt::AlignCenter;
        checkmark.rect = QRectF(QPointF(padding.left(), 0), indicator.size());

        const qreal gap = kCheckmarkSpacing * textScaleFactor * (layout.largeTextScale ? 2 : 1);
        titleLeft = checkmark.rect.right() + gap;
    }

    // Large text gives the whole row to the title
    LayoutElement icon;
    const bool showIcon = !layout.largeTextScale && !spec.icon.isNull();
    if (showIcon) {
        icon.role = LayoutRole::Icon;
        icon.alignment = Qt::AlignCenter;
        icon.rect = QRectF(titleRight - layout.iconSize, 0, layout.iconSize, layout.iconSize);
        titleRight = icon.rect.left() - kTrailingIconSpacing;
    }

    LayoutElement title;
    title.role = LayoutRole::Title;
    title.alignment = Qt::AlignLeft | Qt::AlignVCenter;
    const qreal titleWidth = qMax<qreal>(0, titleRight - titleLeft);
    title.lines = truncateTitle(spec.title, QFontMetricsF(textStyle.font()), titleWidth, layout.maxLines);
    title.rect = QRectF(titleLeft, 0, titleWidth, lineHeight * qMax(1, int(title.lines.size())));

    qreal contentHeight = title.rect.height();
    if (selectionVisible)
        contentHeight = qMax(contentHeight, checkmark.rect.height());
    if (showIcon)
        contentHeight = qMax(contentHeight, icon.rect.height());

    const qreal height = qMax(TextScale::minimumItemHeight(textScaleFactor),
                              padding.top() + contentHeight + padding.bottom());
    layout.size = QSizeF(width, height);

    // Center every element vertically in the padded content box
    const qreal available = height - padding.top() - padding.bottom();
    auto centerVertically = [&](LayoutElement& e) {
        e.rect.moveTop(padding.top() + (available - e.rect.height()) / 2);
    };

    if (selectionVisible) {
        centerVertically(checkmark);
        layout.elements.push_back(checkmark);
    }
    centerVertically(title);
    layout.elements.push_back(title);
    if (showIcon) {
        centerVertically(icon);
        layout.elements.push_back(icon);
    }

    return layout;
}

}
