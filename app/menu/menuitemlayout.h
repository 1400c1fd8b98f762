#pragma once

#include <QMarginsF>
#include <QRectF>
#include <QSizeF>
#include <QStringList>

#include <vector>

#include "menuitemspec.h"
#include "menuitemtheme.h"

class QFontMetricsF;

namespace PullDown {

enum class LayoutRole {
    Icon,
    Title,
    Checkmark,
};

struct LayoutElement {
    LayoutRole role = LayoutRole::Title;
    QRectF rect;            // item-local coordinates
    Qt::Alignment alignment;
    QStringList lines;      // Title only: lines after truncation
};

/**
 * Visual structure of one item for one layout pass. The variant decides
 * which elements exist; painting only walks the element list.
 */
struct MenuItemLayout {
    SizeClassification variant = SizeClassification::Full;
    QSizeF size;
    QMarginsF padding;
    int maxLines = 1;
    bool largeTextScale = false;
    qreal textScaleFactor = 1.0;
    qreal iconSize = 0;
    std::vector<LayoutElement> elements;

    const LayoutElement* element(LayoutRole role) const;
    bool has(LayoutRole role) const { return element(role) != nullptr; }
};

class VariantLayoutSelector {
public:
    // Layout for an item of the given width. selectionVisible reserves the
    // leading checkmark column; it is ignored outside the Full variant.
    static MenuItemLayout buildLayout(SizeClassification classification,
                                      const MenuItemSpec& spec,
                                      const ResolvedItemStyle& style,
                                      bool selectionVisible,
                                      qreal width,
                                      qreal textScaleFactor);

    // Soft wrap is off: explicit lines only, each elided to width, at most
    // maxLines of them. A dropped tail is marked by an ellipsis on the last
    // kept line.
    static QStringList truncateTitle(const QString& title, const QFontMetricsF& metrics,
                                     qreal width, int maxLines);

private:
    static MenuItemLayout buildCompact(const MenuItemSpec& spec, const ResolvedItemStyle& style,
                                       qreal width, qreal textScaleFactor);
    static MenuItemLayout buildStandard(const MenuItemSpec& spec, const ResolvedItemStyle& style,
                                        qreal width, qreal textScaleFactor);
    static MenuItemLayout buildFull(const MenuItemSpec& spec, const ResolvedItemStyle& style,
                                    bool selectionVisible, qreal width, qreal textScaleFactor);
};

}
