#include <QtTest>
#include <QRegularExpression>
#include <QSettings>
#include <QTemporaryDir>

#include <memory>

#include "menu/menuthemesettings.h"

using namespace PullDown;

class TestMenuThemeSettings : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void emptyFileLeavesThemeUnset();
    void partialFileSetsOnlyNamedFields();
    void invalidValuesAreIgnored();
    void textStyleGroupStartsFromDefaults();
    void checkmarkCodePoint();
    void saveThenLoad();
    void brightness();
    void customGroup();

private:
    QString settingsPath() const { return m_Dir->filePath(QStringLiteral("menu.ini")); }

    std::unique_ptr<QTemporaryDir> m_Dir;
};

void TestMenuThemeSettings::init()
{
    m_Dir.reset(new QTemporaryDir());
    QVERIFY(m_Dir->isValid());
}

void TestMenuThemeSettings::cleanup()
{
    m_Dir.reset();
}

void TestMenuThemeSettings::emptyFileLeavesThemeUnset()
{
    QSettings settings(settingsPath(), QSettings::IniFormat);
    const MenuItemTheme theme = MenuThemeSettings::load(settings);

    QVERIFY(!theme.textStyle.has_value());
    QVERIFY(!theme.iconSize.has_value());
    QVERIFY(!theme.destructiveColor.has_value());
    QVERIFY(!theme.checkmark.has_value());
    QVERIFY(!theme.disabledOpacity.has_value());
}

void TestMenuThemeSettings::partialFileSetsOnlyNamedFields()
{
    {
        QSettings settings(settingsPath(), QSettings::IniFormat);
        settings.setValue(QStringLiteral("PullDownMenu/iconSize"), 22);
        settings.setValue(QStringLiteral("PullDownMenu/destructiveColor"), QStringLiteral("#c00000"));
        settings.setValue(QStringLiteral("PullDownMenu/checkmarkWeight"), QStringLiteral("Bold"));
    }

    QSettings settings(settingsPath(), QSettings::IniFormat);
    const MenuItemTheme theme = MenuThemeSettings::load(settings);

    QCOMPARE(*theme.iconSize, 22.0);
    QCOMPARE(*theme.destructiveColor, QColor(0xc0, 0, 0));
    QCOMPARE(*theme.checkmarkWeight, int(QFont::Bold));
    QVERIFY(!theme.onHoverColor.has_value());
    QVERIFY(!theme.checkmarkSize.has_value());

    // Unset fields resolve through the cascade
    const MenuItemTheme defaults = MenuItemTheme::defaults(Brightness::Light);
    const ResolvedItemStyle style = resolveItemStyle(nullptr, &theme, defaults, true, false);
    QCOMPARE(style.iconSize(), 22.0);
    QCOMPARE(style.checkmarkSize(), *defaults.checkmarkSize);
}

void TestMenuThemeSettings::invalidValuesAreIgnored()
{
    {
        QSettings settings(settingsPath(), QSettings::IniFormat);
        settings.setValue(QStringLiteral("PullDownMenu/onHoverColor"), QStringLiteral("not-a-color"));
        settings.setValue(QStringLiteral("PullDownMenu/disabledOpacity"), 1.5);
        settings.setValue(QStringLiteral("PullDownMenu/checkmarkWeight"), QStringLiteral("heavy-ish"));
    }

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Ignoring invalid color")));
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Ignoring out of range value")));
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Ignoring unknown font weight")));

    QSettings settings(settingsPath(), QSettings::IniFormat);
    const MenuItemTheme theme = MenuThemeSettings::load(settings);

    QVERIFY(!theme.onHoverColor.has_value());
    QVERIFY(!theme.disabledOpacity.has_value());
    QVERIFY(!theme.checkmarkWeight.has_value());
}

void TestMenuThemeSettings::textStyleGroupStartsFromDefaults()
{
    {
        QSettings settings(settingsPath(), QSettings::IniFormat);
        settings.setValue(QStringLiteral("PullDownMenu/textStyle/pixelSize"), 16);
    }

    QSettings settings(settingsPath(), QSettings::IniFormat);
    const MenuItemTheme theme = MenuThemeSettings::load(settings, Brightness::Dark);
    const MenuItemTheme defaults = MenuItemTheme::defaults(Brightness::Dark);

    QVERIFY(theme.textStyle.has_value());
    QCOMPARE(theme.textStyle->pixelSize, 16.0);
    QCOMPARE(theme.textStyle->color, defaults.textStyle->color);
    QCOMPARE(theme.textStyle->lineHeight, defaults.textStyle->lineHeight);
    QVERIFY(!theme.iconActionTextStyle.has_value());
}

void TestMenuThemeSettings::checkmarkCodePoint()
{
    {
        QSettings settings(settingsPath(), QSettings::IniFormat);
        settings.setValue(QStringLiteral("PullDownMenu/checkmark/codePoint"), QStringLiteral("0x2714"));
        settings.setValue(QStringLiteral("PullDownMenu/checkmark/fontFamily"), QStringLiteral("Symbols"));
    }

    QSettings settings(settingsPath(), QSettings::IniFormat);
    const MenuItemTheme theme = MenuThemeSettings::load(settings);

    QVERIFY(theme.checkmark.has_value());
    QCOMPARE(theme.checkmark->codePoint, QChar(0x2714));
    QCOMPARE(theme.checkmark->fontFamily, QStringLiteral("Symbols"));

    settings.setValue(QStringLiteral("PullDownMenu/checkmark/codePoint"), QStringLiteral("0x1F600"));
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Ignoring checkmark code point")));
    QVERIFY(!MenuThemeSettings::load(settings).checkmark.has_value());
}

void TestMenuThemeSettings::saveThenLoad()
{
    MenuItemTheme theme;
    theme.iconSize = 24;
    theme.pressedColor = QColor(0, 0, 0, 30);
    theme.checkmark = IconGlyph{QChar(0x2713), QString()};

    MenuTextStyle hover = *MenuItemTheme::defaults(Brightness::Light).onHoverTextStyle;
    hover.pixelSize = 18;
    hover.weight = QFont::Medium;
    theme.onHoverTextStyle = hover;

    {
        QSettings settings(settingsPath(), QSettings::IniFormat);
        MenuThemeSettings::save(settings, theme);
    }

    QSettings settings(settingsPath(), QSettings::IniFormat);
    const MenuItemTheme loaded = MenuThemeSettings::load(settings);

    QCOMPARE(*loaded.iconSize, 24.0);
    QCOMPARE(*loaded.pressedColor, QColor(0, 0, 0, 30));
    QCOMPARE(*loaded.checkmark, *theme.checkmark);
    QCOMPARE(loaded.onHoverTextStyle->pixelSize, 18.0);
    QCOMPARE(loaded.onHoverTextStyle->weight, int(QFont::Medium));
    QCOMPARE(loaded.onHoverTextStyle->color, hover.color);
    QVERIFY(!loaded.textStyle.has_value());
}

void TestMenuThemeSettings::brightness()
{
    QSettings settings(settingsPath(), QSettings::IniFormat);
    QCOMPARE(MenuThemeSettings::loadBrightness(settings, Brightness::Dark), Brightness::Dark);

    settings.setValue(QStringLiteral("PullDownMenu/brightness"), QStringLiteral("Dark"));
    QCOMPARE(MenuThemeSettings::loadBrightness(settings), Brightness::Dark);

    settings.setValue(QStringLiteral("PullDownMenu/brightness"), QStringLiteral("light"));
    QCOMPARE(MenuThemeSettings::loadBrightness(settings, Brightness::Dark), Brightness::Light);

    settings.setValue(QStringLiteral("PullDownMenu/brightness"), QStringLiteral("dim"));
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Unknown brightness")));
    QCOMPARE(MenuThemeSettings::loadBrightness(settings), Brightness::Light);
}

void TestMenuThemeSettings::customGroup()
{
    QSettings settings(settingsPath(), QSettings::IniFormat);
    settings.setValue(QStringLiteral("Sidebar/iconSize"), 18);

    QVERIFY(!MenuThemeSettings::load(settings).iconSize.has_value());
    QCOMPARE(*MenuThemeSettings::load(settings, Brightness::Light, QStringLiteral("Sidebar")).iconSize, 18.0);
}

QTEST_MAIN(TestMenuThemeSettings)
#include "tst_menuthemesettings.moc"
