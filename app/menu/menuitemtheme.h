#pragma once

#include <QChar>
#include <QColor>
#include <QFont>
#include <QString>

#include <optional>

namespace PullDown {

enum class SizeClassification;

enum class Brightness {
    Light,
    Dark,
};

// A single character of an icon font.
struct IconGlyph {
    QChar codePoint;
    QString fontFamily;   // empty = application default family

    bool operator==(const IconGlyph& other) const
    {
        return codePoint == other.codePoint && fontFamily == other.fontFamily;
    }
    bool operator!=(const IconGlyph& other) const { return !(*this == other); }
};

struct MenuTextStyle {
    QString family;           // empty = application default family
    qreal pixelSize = 17;
    int weight = QFont::Normal;
    qreal lineHeight = 1.0;   // line box height as a multiple of pixelSize
    QColor color;

    QFont font() const;
    qreal lineBoxHeight() const { return pixelSize * lineHeight; }

    MenuTextStyle withColor(const QColor& newColor) const;

    // Same style with the text size multiplied by factor.
    MenuTextStyle scaled(qreal factor) const;

    bool operator==(const MenuTextStyle& other) const;
    bool operator!=(const MenuTextStyle& other) const { return !(*this == other); }
};

/**
 * Partial item style. Used for the per-item override, the ambient menu
 * theme and the static defaults; unset fields fall through to the next
 * layer during resolution.
 */
struct MenuItemTheme {
    std::optional<MenuTextStyle> textStyle;
    std::optional<MenuTextStyle> iconActionTextStyle;
    std::optional<MenuTextStyle> onHoverTextStyle;
    std::optional<qreal> iconSize;
    std::optional<IconGlyph> checkmark;
    std::optional<int> checkmarkWeight;
    std::optional<qreal> checkmarkSize;
    std::optional<QColor> destructiveColor;
    std::optional<QColor> onHoverColor;
    std::optional<QColor> pressedColor;
    std::optional<qreal> disabledOpacity;

    // Field by field: this theme's value when set, otherwise fallback's.
    MenuItemTheme merged(const MenuItemTheme& fallback) const;

    // Complete theme matching the native look for the given appearance.
    static MenuItemTheme defaults(Brightness brightness);
};

class ResolvedItemStyle;

/**
 * Merges override -> ambient -> defaults into one style.
 *
 * itemOverride and ambient may be null when the layer is absent. Destructive
 * items take destructiveColor for text and icon and ignore iconColor.
 * Disabled items get their text and icon colors faded by disabledOpacity.
 */
ResolvedItemStyle resolveItemStyle(const MenuItemTheme* itemOverride,
                                   const MenuItemTheme* ambient,
                                   const MenuItemTheme& defaults,
                                   bool enabled,
                                   bool isDestructive,
                                   const QColor& iconColor = QColor());

/**
 * Fully merged item style. Built once per layout pass by resolveItemStyle()
 * and never modified afterwards.
 */
class ResolvedItemStyle {
public:
    ResolvedItemStyle();

    const MenuTextStyle& textStyle() const { return m_TextStyle; }
    const MenuTextStyle& iconActionTextStyle() const { return m_IconActionTextStyle; }
    const MenuTextStyle& onHoverTextStyle() const { return m_OnHoverTextStyle; }
    qreal iconSize() const { return m_IconSize; }
    const IconGlyph& checkmark() const { return m_Checkmark; }
    int checkmarkWeight() const { return m_CheckmarkWeight; }
    qreal checkmarkSize() const { return m_CheckmarkSize; }
    const QColor& destructiveColor() const { return m_DestructiveColor; }
    const QColor& onHoverColor() const { return m_OnHoverColor; }
    const QColor& pressedColor() const { return m_PressedColor; }
    qreal disabledOpacity() const { return m_DisabledOpacity; }

    // Explicit icon tint that survived resolution. Invalid if none applies.
    const QColor& iconColorOverride() const { return m_IconColorOverride; }

    const MenuTextStyle& textStyleFor(SizeClassification size) const;
    MenuTextStyle hoverTextStyleFor(SizeClassification size) const;
    QColor iconColorFor(SizeClassification size) const;
    QColor hoverIconColor() const { return m_OnHoverTextStyle.color; }

private:
    friend ResolvedItemStyle resolveItemStyle(const MenuItemTheme*, const MenuItemTheme*,
                                              const MenuItemTheme&, bool, bool, const QColor&);

    MenuTextStyle m_TextStyle;
    MenuTextStyle m_IconActionTextStyle;
    MenuTextStyle m_OnHoverTextStyle;
    qreal m_IconSize;
    IconGlyph m_Checkmark;
    int m_CheckmarkWeight;
    qreal m_CheckmarkSize;
    QColor m_DestructiveColor;
    QColor m_OnHoverColor;
    QColor m_PressedColor;
    qreal m_DisabledOpacity;
    QColor m_IconColorOverride;
};

}
