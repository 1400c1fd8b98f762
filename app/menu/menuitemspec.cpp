#include "menuitemspec.h"

#include <QPainter>

namespace PullDown {

void IconContent::paint(QPainter* painter, const QRectF& rect, const QColor& color) const
{
    switch (m_Kind) {
    case Kind::None:
        break;

    case Kind::Glyph: {
        QFont font;
        if (!m_Glyph.fontFamily.isEmpty())
            font.setFamily(m_Glyph.fontFamily);
        font.setPixelSize(qMax(1, qRound(qMin(rect.width(), rect.height()))));

        painter->save();
        painter->setFont(font);
        painter->setPen(color);
        painter->drawText(rect, Qt::AlignCenter, QString(m_Glyph.codePoint));
        painter->restore();
        break;
    }

    case Kind::Custom:
        painter->save();
        m_Custom->paint(painter, rect, color);
        painter->restore();
        break;
    }
}

}
