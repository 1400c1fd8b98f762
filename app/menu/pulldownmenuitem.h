#pragma once

#include <QPointF>
#include <QRectF>
#include <QString>

#include <optional>

#include "interactionstate.h"
#include "menuitemlayout.h"
#include "menuitemspec.h"
#include "menuitemtheme.h"
#include "tapdispatcher.h"

class QPainter;

namespace PullDown {

// Single accessibility node for the whole item.
struct ItemSemantics {
    QString label;
    bool enabled = true;
    bool isButton = true;
    std::optional<bool> selected;
};

/**
 * PullDownMenuItem - one actionable row of a pull-down menu.
 *
 * Each layout pass (build()) resolves the style cascade for the current
 * context and picks the layout variant; pointer events drive the item's own
 * InteractionStateMachine, and a completed tap is handed to TapDispatcher.
 */
class PullDownMenuItem
{
public:
    explicit PullDownMenuItem(MenuItemSpec spec);

    const MenuItemSpec& spec() const { return m_Spec; }

    // Compact and Standard variants show nothing but the icon, so one is required.
    static bool hasRequiredIcon(SizeClassification size, const MenuItemSpec& spec);

    void build(const MenuItemContext& context, qreal width);

    const ResolvedItemStyle& style() const { return m_Style; }
    const MenuItemLayout& layout() const { return m_Layout; }
    const MenuItemContext& context() const { return m_Context; }
    QSizeF size() const { return m_Layout.size; }

    bool isSelectionVisible() const;
    bool isInteractive() const;

    void paint(QPainter* painter, const QPointF& origin) const;

    InteractionStateMachine& interaction() { return m_Interaction; }
    const InteractionStateMachine& interaction() const { return m_Interaction; }

    void hoverEntered() { m_Interaction.pointerEntered(); }
    void hoverLeft() { m_Interaction.pointerLeft(); }
    void pressed() { m_Interaction.pointerPressed(); }

    // Completes the press and dispatches the tap when it activates the item.
    // Returns whether a tap was dispatched.
    bool released();

    // Dispatches the tap as if the item was clicked.
    void activate();

    ItemSemantics semantics() const;

private:
    Q_DISABLE_COPY(PullDownMenuItem)

    MenuItemSpec m_Spec;
    MenuItemContext m_Context;
    ResolvedItemStyle m_Style;
    MenuItemLayout m_Layout;
    InteractionStateMachine m_Interaction;
};

}
