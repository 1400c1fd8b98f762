#include "selectionindicator.h"

#include <QPainter>

namespace PullDown {

SelectionIndicator::SelectionIndicator(bool selected, const IconGlyph& glyph, int weight, qreal size)
    : m_Selected(selected),
      m_Glyph(glyph),
      m_Weight(weight),
      m_Size(size)
{
}

QFont SelectionIndicator::glyphFont() const
{
    MenuTextStyle style;
    style.family = m_Glyph.fontFamily;
    style.pixelSize = m_Size;
    style.weight = m_Weight;
    return style.font();
}

void SelectionIndicator::paint(QPainter* painter, const QPointF& topLeft, const QColor& color) const
{
    if (!m_Selected || m_Glyph.codePoint.isNull())
        return;

    painter->save();
    painter->setFont(glyphFont());
    painter->setPen(color);
    painter->drawText(QRectF(topLeft, size()), Qt::AlignCenter, QString(m_Glyph.codePoint));
    painter->restore();
}

}
