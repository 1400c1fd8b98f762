#include "pulldownmenuitem.h"
#include "selectionindicator.h"

#include <QPainter>

namespace PullDown {

PullDownMenuItem::PullDownMenuItem(MenuItemSpec spec)
    : m_Spec(std::move(spec)),
      m_Interaction(m_Spec.enabled)
{
}

bool PullDownMenuItem::hasRequiredIcon(SizeClassification size, const MenuItemSpec& spec)
{
    switch (size) {
    case SizeClassification::Compact:
    case SizeClassification::Standard:
        return !spec.icon.isNull();
    case SizeClassification::Full:
        return true;
    }
    return true;
}

void PullDownMenuItem::build(const MenuItemContext& context, qreal width)
{
    Q_ASSERT_X(hasRequiredIcon(context.size, m_Spec), "PullDownMenuItem::build",
               "Either an icon glyph or custom icon content is required for compact and standard items");

    m_Context = context;

    const MenuItemTheme defaults = MenuItemTheme::defaults(context.brightness);
    m_Style = resolveItemStyle(m_Spec.styleOverride ? &*m_Spec.styleOverride : nullptr,
                               context.ambientTheme,
                               defaults,
                               m_Spec.enabled,
                               m_Spec.isDestructive,
                               m_Spec.iconColor);

    m_Layout = VariantLayoutSelector::buildLayout(context.size, m_Spec, m_Style,
                                                  isSelectionVisible(), width,
                                                  context.textScaleFactor);
}

bool PullDownMenuItem::isSelectionVisible() const
{
    if (m_Context.size != SizeClassification::Full)
        return false;

    return m_Spec.selected.has_value() || m_Context.selectableGroup;
}

bool PullDownMenuItem::isInteractive() const
{
    return m_Spec.enabled && m_Spec.onTap;
}

void PullDownMenuItem::paint(QPainter* painter, const QPointF& origin) const
{
    const SizeClassification size = m_Layout.variant;
    const bool hovered = m_Interaction.isHovered();

    painter->save();
    painter->translate(origin);

    const QRectF bounds(QPointF(0, 0), m_Layout.size);
    if (m_Interaction.isPressed()) {
        painter->fillRect(bounds, m_Style.pressedColor());
    } else if (hovered) {
        painter->fillRect(bounds, m_Style.onHoverColor());
    }

    const MenuTextStyle textStyle =
            (hovered ? m_Style.hoverTextStyleFor(size) : m_Style.textStyleFor(size))
            .scaled(m_Layout.textScaleFactor);
    const QColor iconColor = hovered ? m_Style.hoverIconColor() : m_Style.iconColorFor(size);

    for (const auto& e : m_Layout.elements) {
        switch (e.role) {
        case LayoutRole::Icon:
            m_Spec.icon.paint(painter, e.rect, iconColor);
            break;

        case LayoutRole::Title: {
            const qreal lineHeight = textStyle.lineBoxHeight();
            painter->setFont(textStyle.font());
            painter->setPen(textStyle.color);
            for (int i = 0; i < e.lines.size(); i++) {
                QRectF lineRect(e.rect.left(), e.rect.top() + i * lineHeight, e.rect.width(), lineHeight);
                painter->drawText(lineRect, e.alignment, e.lines[i]);
            }
            break;
        }

        case LayoutRole::Checkmark: {
            const SelectionIndicator indicator(m_Spec.selected.value_or(false), m_Style.checkmark(),
                                               m_Style.checkmarkWeight(), m_Style.checkmarkSize());
            indicator.paint(painter, e.rect.topLeft(), textStyle.color);
            break;
        }
        }
    }

    painter->restore();
}

bool PullDownMenuItem::released()
{
    if (!m_Interaction.pointerReleased())
        return false;
    if (!isInteractive())
        return false;

    activate();
    return true;
}

void PullDownMenuItem::activate()
{
    if (!isInteractive())
        return;

    // onTap may rebuild the menu and destroy this item while it runs
    const std::function<void()> onTap = m_Spec.onTap;
    const MenuItemContext context = m_Context;
    TapDispatcher::activate(context, onTap, m_Spec.tapPolicy);
}

ItemSemantics PullDownMenuItem::semantics() const
{
    ItemSemantics semantics;
    semantics.label = m_Spec.title;
    semantics.enabled = m_Spec.enabled;
    semantics.isButton = true;
    semantics.selected = m_Spec.selected;
    return semantics;
}

}
