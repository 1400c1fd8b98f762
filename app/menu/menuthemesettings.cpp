#include "menuthemesettings.h"

#include <QDebug>
#include <QSettings>
#include <QStringList>

namespace PullDown {

namespace {

struct WeightName {
    const char* name;
    QFont::Weight weight;
};

const WeightName kWeightNames[] = {
    { "thin",     QFont::Thin },
    { "light",    QFont::Light },
    { "normal",   QFont::Normal },
    { "medium",   QFont::Medium },
    { "demibold", QFont::DemiBold },
    { "bold",     QFont::Bold },
    { "black",    QFont::Black },
};

bool parseWeight(const QString& text, int& weight)
{
    for (const auto& entry : kWeightNames) {
        if (text.compare(QLatin1String(entry.name), Qt::CaseInsensitive) == 0) {
            weight = entry.weight;
            return true;
        }
    }
    return false;
}

QString weightName(int weight)
{
    // Nearest named weight
    const WeightName* best = &kWeightNames[0];
    for (const auto& entry : kWeightNames) {
        if (qAbs(entry.weight - weight) < qAbs(best->weight - weight))
            best = &entry;
    }
    return QLatin1String(best->name);
}

void readColor(QSettings& settings, const QString& key, std::optional<QColor>& out)
{
    if (!settings.contains(key))
        return;

    const QString text = settings.value(key).toString().trimmed();
    QColor color(text);
    if (!color.isValid()) {
        qWarning() << "[MenuTheme] Ignoring invalid color" << key << "=" << text;
        return;
    }
    out = color;
}

// Accepts values in (min, max]
void readReal(QSettings& settings, const QString& key, qreal min, qreal max, std::optional<qreal>& out)
{
    if (!settings.contains(key))
        return;

    bool ok = false;
    const qreal value = settings.value(key).toDouble(&ok);
    if (!ok || value <= min || value > max) {
        qWarning() << "[MenuTheme] Ignoring out of range value" << key << "=" << settings.value(key);
        return;
    }
    out = value;
}

void readWeight(QSettings& settings, const QString& key, std::optional<int>& out)
{
    if (!settings.contains(key))
        return;

    int weight = QFont::Normal;
    if (!parseWeight(settings.value(key).toString(), weight)) {
        qWarning() << "[MenuTheme] Ignoring unknown font weight" << key << "=" << settings.value(key);
        return;
    }
    out = weight;
}

void readTextStyle(QSettings& settings, const QString& group, const MenuTextStyle& base,
                   std::optional<MenuTextStyle>& out)
{
    if (!settings.childGroups().contains(group))
        return;

    settings.beginGroup(group);

    MenuTextStyle style(base);
    if (settings.contains(QStringLiteral("family")))
        style.family = settings.value(QStringLiteral("family")).toString();

    std::optional<qreal> pixelSize, lineHeight;
    readReal(settings, QStringLiteral("pixelSize"), 0, 200, pixelSize);
    readReal(settings, QStringLiteral("lineHeight"), 0, 10, lineHeight);
    style.pixelSize = pixelSize.value_or(style.pixelSize);
    style.lineHeight = lineHeight.value_or(style.lineHeight);

    std::optional<int> weight;
    readWeight(settings, QStringLiteral("weight"), weight);
    style.weight = weight.value_or(style.weight);

    std::optional<QColor> color;
    readColor(settings, QStringLiteral("color"), color);
    style.color = color.value_or(style.color);

    settings.endGroup();
    out = style;
}

void writeTextStyle(QSettings& settings, const QString& group, const std::optional<MenuTextStyle>& style)
{
    if (!style)
        return;

    settings.beginGroup(group);
    if (!style->family.isEmpty())
        settings.setValue(QStringLiteral("family"), style->family);
    settings.setValue(QStringLiteral("pixelSize"), style->pixelSize);
    settings.setValue(QStringLiteral("lineHeight"), style->lineHeight);
    settings.setValue(QStringLiteral("weight"), weightName(style->weight));
    settings.setValue(QStringLiteral("color"), style->color.name(QColor::HexArgb));
    settings.endGroup();
}

void writeColor(QSettings& settings, const QString& key, const std::optional<QColor>& color)
{
    if (color)
        settings.setValue(key, color->name(QColor::HexArgb));
}

}

MenuItemTheme MenuThemeSettings::load(QSettings& settings, Brightness brightness, const QString& group)
{
    const MenuItemTheme defaults = MenuItemTheme::defaults(brightness);
    MenuItemTheme theme;

    settings.beginGroup(group);

    readTextStyle(settings, QStringLiteral("textStyle"), *defaults.textStyle, theme.textStyle);
    readTextStyle(settings, QStringLiteral("iconActionTextStyle"), *defaults.iconActionTextStyle,
                  theme.iconActionTextStyle);
    readTextStyle(settings, QStringLiteral("onHoverTextStyle"), *defaults.onHoverTextStyle,
                  theme.onHoverTextStyle);

    readReal(settings, QStringLiteral("iconSize"), 0, 256, theme.iconSize);
    readReal(settings, QStringLiteral("checkmarkSize"), 0, 256, theme.checkmarkSize);
    readReal(settings, QStringLiteral("disabledOpacity"), 0, 1, theme.disabledOpacity);
    readWeight(settings, QStringLiteral("checkmarkWeight"), theme.checkmarkWeight);

    readColor(settings, QStringLiteral("destructiveColor"), theme.destructiveColor);
    readColor(settings, QStringLiteral("onHoverColor"), theme.onHoverColor);
    readColor(settings, QStringLiteral("pressedColor"), theme.pressedColor);

    if (settings.contains(QStringLiteral("checkmark/codePoint"))) {
        const QString text = settings.value(QStringLiteral("checkmark/codePoint")).toString();
        bool ok = false;
        const uint codePoint = text.toUInt(&ok, 0);
        if (!ok || codePoint == 0 || codePoint > 0xFFFF) {
            qWarning() << "[MenuTheme] Ignoring checkmark code point" << text;
        } else {
            IconGlyph glyph;
            glyph.codePoint = QChar(ushort(codePoint));
            glyph.fontFamily = settings.value(QStringLiteral("checkmark/fontFamily")).toString();
            theme.checkmark = glyph;
        }
    }

    settings.endGroup();
    return theme;
}

void MenuThemeSettings::save(QSettings& settings, const MenuItemTheme& theme, const QString& group)
{
    settings.beginGroup(group);

    writeTextStyle(settings, QStringLiteral("textStyle"), theme.textStyle);
    writeTextStyle(settings, QStringLiteral("iconActionTextStyle"), theme.iconActionTextStyle);
    writeTextStyle(settings, QStringLiteral("onHoverTextStyle"), theme.onHoverTextStyle);

    if (theme.iconSize)
        settings.setValue(QStringLiteral("iconSize"), *theme.iconSize);
    if (theme.checkmarkSize)
        settings.setValue(QStringLiteral("checkmarkSize"), *theme.checkmarkSize);
    if (theme.disabledOpacity)
        settings.setValue(QStringLiteral("disabledOpacity"), *theme.disabledOpacity);
    if (theme.checkmarkWeight)
        settings.setValue(QStringLiteral("checkmarkWeight"), weightName(*theme.checkmarkWeight));

    writeColor(settings, QStringLiteral("destructiveColor"), theme.destructiveColor);
    writeColor(settings, QStringLiteral("onHoverColor"), theme.onHoverColor);
    writeColor(settings, QStringLiteral("pressedColor"), theme.pressedColor);

    if (theme.checkmark) {
        settings.setValue(QStringLiteral("checkmark/codePoint"),
                          QStringLiteral("0x%1").arg(uint(theme.checkmark->codePoint.unicode()), 4, 16, QLatin1Char('0')));
        if (!theme.checkmark->fontFamily.isEmpty())
            settings.setValue(QStringLiteral("checkmark/fontFamily"), theme.checkmark->fontFamily);
    }

    settings.endGroup();
}

Brightness MenuThemeSettings::loadBrightness(QSettings& settings, Brightness fallback, const QString& group)
{
    const QString key = group + QStringLiteral("/brightness");
    if (!settings.contains(key))
        return fallback;

    const QString text = settings.value(key).toString();
    if (text.compare(QLatin1String("dark"), Qt::CaseInsensitive) == 0)
        return Brightness::Dark;
    if (text.compare(QLatin1String("light"), Qt::CaseInsensitive) == 0)
        return Brightness::Light;

    qWarning() << "[MenuTheme] Unknown brightness" << text << "- keeping default";
    return fallback;
}

}
