#include <QtTest>
#include <QImage>
#include <QPainter>

#include "menu/menuitemtheme.h"
#include "menu/selectionindicator.h"

using namespace PullDown;

namespace {

bool isTransparent(const QImage& image)
{
    for (int y = 0; y < image.height(); y++) {
        for (int x = 0; x < image.width(); x++) {
            if (qAlpha(image.pixel(x, y)) != 0)
                return false;
        }
    }
    return true;
}

}

class TestSelectionIndicator : public QObject
{
    Q_OBJECT

private slots:
    void sizeIndependentOfSelection();
    void unselectedPaintsNothing();
    void nullGlyphPaintsNothing();
    void glyphFontFollowsStyle();
};

void TestSelectionIndicator::sizeIndependentOfSelection()
{
    const IconGlyph check{QChar(0x2713), QString()};

    const SelectionIndicator on(true, check, QFont::DemiBold, 15);
    const SelectionIndicator off(false, check, QFont::DemiBold, 15);

    QVERIFY(on.isSelected());
    QVERIFY(!off.isSelected());
    QCOMPARE(on.size(), QSizeF(15, 15));
    QCOMPARE(on.size(), off.size());
}

void TestSelectionIndicator::unselectedPaintsNothing()
{
    QImage image(32, 32, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);

    const SelectionIndicator off(false, IconGlyph{QChar(0x2713), QString()}, QFont::DemiBold, 30);
    {
        QPainter painter(&image);
        off.paint(&painter, QPointF(1, 1), Qt::black);
    }

    QVERIFY(isTransparent(image));
}

void TestSelectionIndicator::nullGlyphPaintsNothing()
{
    QImage image(32, 32, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);

    const SelectionIndicator on(true, IconGlyph{QChar(), QString()}, QFont::DemiBold, 30);
    {
        QPainter painter(&image);
        on.paint(&painter, QPointF(1, 1), Qt::black);
    }

    QVERIFY(isTransparent(image));
}

void TestSelectionIndicator::glyphFontFollowsStyle()
{
    const ResolvedItemStyle style = resolveItemStyle(nullptr, nullptr,
                                                     MenuItemTheme::defaults(Brightness::Light),
                                                     true, false);

    const SelectionIndicator indicator(true, style.checkmark(), style.checkmarkWeight(), style.checkmarkSize());
    const QFont font = indicator.glyphFont();

    QCOMPARE(qreal(font.pixelSize()), style.checkmarkSize());
    QCOMPARE(int(font.weight()), int(QFont::DemiBold));
    QCOMPARE(style.checkmark().codePoint, QChar(0x2713));
}

QTEST_MAIN(TestSelectionIndicator)
#include "tst_selectionindicator.moc"
