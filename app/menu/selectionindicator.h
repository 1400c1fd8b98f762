#pragma once

#include <QColor>
#include <QFont>
#include <QPointF>
#include <QSizeF>

#include "menuitemtheme.h"

class QPainter;

namespace PullDown {

/**
 * SelectionIndicator - checkmark column of a selectable Full item.
 *
 * Always occupies size x size, selected or not, so toggling the
 * selection never moves the title.
 */
class SelectionIndicator {
public:
    SelectionIndicator(bool selected, const IconGlyph& glyph, int weight, qreal size);

    bool isSelected() const { return m_Selected; }
    QSizeF size() const { return QSizeF(m_Size, m_Size); }
    QFont glyphFont() const;

    // Draws nothing when unselected; the space stays reserved.
    void paint(QPainter* painter, const QPointF& topLeft, const QColor& color) const;

private:
    bool m_Selected;
    IconGlyph m_Glyph;
    int m_Weight;
    qreal m_Size;
};

}
