#pragma once

#include <QChar>
#include <QColor>
#include <QFont>
#include <QRectF>
#include <QString>

#include <functional>
#include <memory>
#include <optional>

#include "menuitemtheme.h"

class QPainter;

namespace PullDown {

enum class SizeClassification {
    Compact,    // icon only, used in a dense actions row
    Standard,   // icon above a single-line title, actions row
    Full,       // regular list row with optional checkmark
};

enum class TapPolicy {
    Immediate,              // call onTap, leave the menu open
    PopThenInvoke,          // close the menu, the host calls onTap afterwards
    PopThenDelayedInvoke,   // close the menu, call onTap once the close animation is over
};

/**
 * Custom icon content drawn in place of a glyph. Implementations must be
 * stateless with respect to painting; the same instance may be shared by
 * several items.
 */
class CustomIconContent {
public:
    virtual ~CustomIconContent() = default;

    // Paints into rect using color as the resolved icon tint.
    virtual void paint(QPainter* painter, const QRectF& rect, const QColor& color) const = 0;
};

/**
 * Icon of an item: nothing, a font glyph, or custom content.
 * Only one case can be held at a time.
 */
class IconContent {
public:
    enum class Kind { None, Glyph, Custom };

    IconContent() : m_Kind(Kind::None) {}

    static IconContent fromGlyph(const IconGlyph& glyph)
    {
        IconContent content;
        content.m_Kind = Kind::Glyph;
        content.m_Glyph = glyph;
        return content;
    }

    static IconContent fromCustom(std::shared_ptr<const CustomIconContent> custom)
    {
        IconContent content;
        if (custom) {
            content.m_Kind = Kind::Custom;
            content.m_Custom = std::move(custom);
        }
        return content;
    }

    Kind kind() const { return m_Kind; }
    bool isNull() const { return m_Kind == Kind::None; }
    const IconGlyph& glyph() const { return m_Glyph; }
    const CustomIconContent* custom() const { return m_Custom.get(); }

    void paint(QPainter* painter, const QRectF& rect, const QColor& color) const;

private:
    Kind m_Kind;
    IconGlyph m_Glyph;
    std::shared_ptr<const CustomIconContent> m_Custom;
};

struct MenuItemSpec {
    QString title;
    IconContent icon;

    // Icon tint, ignored for destructive items. Invalid means unset.
    QColor iconColor;

    bool enabled = true;
    bool isDestructive = false;

    // Empty for items that are not selectable.
    std::optional<bool> selected;

    // Top layer of the style cascade.
    std::optional<MenuItemTheme> styleOverride;

    TapPolicy tapPolicy = TapPolicy::PopThenInvoke;
    std::function<void()> onTap;
};

}
