#include "menuitemtheme.h"
#include "menuitemspec.h"

namespace PullDown {

namespace {

template <typename T>
std::optional<T> firstOf(const std::optional<T>& value, const std::optional<T>& fallback)
{
    return value ? value : fallback;
}

QColor faded(QColor color, qreal opacity)
{
    color.setAlphaF(color.alphaF() * opacity);
    return color;
}

}

// ---------------------------------------------------------------------------
// MenuTextStyle
// ---------------------------------------------------------------------------

QFont MenuTextStyle::font() const
{
    QFont f;
    if (!family.isEmpty())
        f.setFamily(family);
    f.setPixelSize(qMax(1, qRound(pixelSize)));
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    f.setWeight(static_cast<QFont::Weight>(weight));
#else
    f.setWeight(weight);
#endif
    return f;
}

MenuTextStyle MenuTextStyle::withColor(const QColor& newColor) const
{
    MenuTextStyle style(*this);
    style.color = newColor;
    return style;
}

MenuTextStyle MenuTextStyle::scaled(qreal factor) const
{
    MenuTextStyle style(*this);
    style.pixelSize = pixelSize * factor;
    return style;
}

bool MenuTextStyle::operator==(const MenuTextStyle& other) const
{
    return family == other.family &&
           pixelSize == other.pixelSize &&
           weight == other.weight &&
           lineHeight == other.lineHeight &&
           color == other.color;
}

// ---------------------------------------------------------------------------
// MenuItemTheme
// ---------------------------------------------------------------------------

MenuItemTheme MenuItemTheme::merged(const MenuItemTheme& fallback) const
{
    MenuItemTheme theme;
    theme.textStyle           = firstOf(textStyle, fallback.textStyle);
    theme.iconActionTextStyle = firstOf(iconActionTextStyle, fallback.iconActionTextStyle);
    theme.onHoverTextStyle    = firstOf(onHoverTextStyle, fallback.onHoverTextStyle);
    theme.iconSize            = firstOf(iconSize, fallback.iconSize);
    theme.checkmark           = firstOf(checkmark, fallback.checkmark);
    theme.checkmarkWeight     = firstOf(checkmarkWeight, fallback.checkmarkWeight);
    theme.checkmarkSize       = firstOf(checkmarkSize, fallback.checkmarkSize);
    theme.destructiveColor    = firstOf(destructiveColor, fallback.destructiveColor);
    theme.onHoverColor        = firstOf(onHoverColor, fallback.onHoverColor);
    theme.pressedColor        = firstOf(pressedColor, fallback.pressedColor);
    theme.disabledOpacity     = firstOf(disabledOpacity, fallback.disabledOpacity);
    return theme;
}

MenuItemTheme MenuItemTheme::defaults(Brightness brightness)
{
    const bool dark = brightness == Brightness::Dark;

    // iOS label / systemRed / systemBlue
    const QColor label       = dark ? QColor(255, 255, 255) : QColor(0, 0, 0);
    const QColor destructive = dark ? QColor(255, 69, 58) : QColor(255, 59, 48);
    const QColor accent      = dark ? QColor(10, 132, 255) : QColor(0, 122, 255);

    MenuTextStyle body;
    body.pixelSize = 17;
    body.lineHeight = 22.0 / 17.0;
    body.weight = QFont::Normal;
    body.color = label;

    MenuTextStyle action;
    action.pixelSize = 15;
    action.lineHeight = 20.0 / 15.0;
    action.weight = QFont::Normal;
    action.color = label;

    MenuTextStyle hover(body);
    hover.color = QColor(255, 255, 255);

    MenuItemTheme theme;
    theme.textStyle = body;
    theme.iconActionTextStyle = action;
    theme.onHoverTextStyle = hover;
    theme.iconSize = 20;
    theme.checkmark = IconGlyph{QChar(0x2713), QString()};
    theme.checkmarkWeight = QFont::DemiBold;
    theme.checkmarkSize = 15;
    theme.destructiveColor = destructive;
    theme.onHoverColor = accent;
    theme.pressedColor = dark ? QColor(0, 0, 0, 41) : QColor(0, 0, 0, 20);
    theme.disabledOpacity = 0.45;
    return theme;
}

// ---------------------------------------------------------------------------
// ResolvedItemStyle
// ---------------------------------------------------------------------------

ResolvedItemStyle::ResolvedItemStyle()
    : m_IconSize(0),
      m_CheckmarkWeight(QFont::Normal),
      m_CheckmarkSize(0),
      m_DisabledOpacity(1.0)
{
}

const MenuTextStyle& ResolvedItemStyle::textStyleFor(SizeClassification size) const
{
    return size == SizeClassification::Full ? m_TextStyle : m_IconActionTextStyle;
}

MenuTextStyle ResolvedItemStyle::hoverTextStyleFor(SizeClassification size) const
{
    if (size == SizeClassification::Full)
        return m_OnHoverTextStyle;

    // Action row cells keep their own metrics while hovered
    MenuTextStyle style(m_OnHoverTextStyle);
    style.pixelSize = m_IconActionTextStyle.pixelSize;
    style.lineHeight = m_IconActionTextStyle.lineHeight;
    return style;
}

QColor ResolvedItemStyle::iconColorFor(SizeClassification size) const
{
    if (m_IconColorOverride.isValid())
        return m_IconColorOverride;
    return textStyleFor(size).color;
}

ResolvedItemStyle resolveItemStyle(const MenuItemTheme* itemOverride,
                                   const MenuItemTheme* ambient,
                                   const MenuItemTheme& defaults,
                                   bool enabled,
                                   bool isDestructive,
                                   const QColor& iconColor)
{
    MenuItemTheme theme = defaults;
    if (ambient)
        theme = ambient->merged(theme);
    if (itemOverride)
        theme = itemOverride->merged(theme);

    ResolvedItemStyle style;
    style.m_TextStyle           = theme.textStyle.value_or(MenuTextStyle());
    style.m_IconActionTextStyle = theme.iconActionTextStyle.value_or(MenuTextStyle());
    style.m_OnHoverTextStyle    = theme.onHoverTextStyle.value_or(MenuTextStyle());
    style.m_IconSize            = theme.iconSize.value_or(0);
    style.m_Checkmark           = theme.checkmark.value_or(IconGlyph());
    style.m_CheckmarkWeight     = theme.checkmarkWeight.value_or(QFont::Normal);
    style.m_CheckmarkSize       = theme.checkmarkSize.value_or(0);
    style.m_DestructiveColor    = theme.destructiveColor.value_or(QColor());
    style.m_OnHoverColor        = theme.onHoverColor.value_or(QColor());
    style.m_PressedColor        = theme.pressedColor.value_or(QColor());
    style.m_DisabledOpacity     = theme.disabledOpacity.value_or(1.0);

    if (isDestructive) {
        style.m_TextStyle.color = style.m_DestructiveColor;
        style.m_IconActionTextStyle.color = style.m_DestructiveColor;
    } else if (iconColor.isValid()) {
        style.m_IconColorOverride = iconColor;
    }

    if (!enabled) {
        const qreal opacity = style.m_DisabledOpacity;
        style.m_TextStyle.color = faded(style.m_TextStyle.color, opacity);
        style.m_IconActionTextStyle.color = faded(style.m_IconActionTextStyle.color, opacity);
        if (style.m_IconColorOverride.isValid())
            style.m_IconColorOverride = faded(style.m_IconColorOverride, opacity);
    }

    return style;
}

}
