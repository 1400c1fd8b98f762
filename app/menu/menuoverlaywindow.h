#pragma once

#include <QRasterWindow>
#include <QPainter>
#include <QMouseEvent>
#include <QSurfaceFormat>
#include <QElapsedTimer>
#include <QPropertyAnimation>

#include <functional>
#include <memory>
#include <vector>

#include "menuitemspec.h"
#include "menuitemtheme.h"
#include "pulldownmenuitem.h"
#include "tapdispatcher.h"

namespace PullDown {

/**
 * MenuOverlayWindow - pull-down menu presented in its own translucent window.
 *
 * Rendered by the OS compositor, independent of whatever the parent window
 * draws. Acts as the route host for its items: a popped tap runs as soon as
 * the close animation starts, and closed() follows once it has finished.
 *
 * Layout (top to bottom):
 *   Actions row (optional):  Compact or Standard cells side by side
 *   Item list:               Full rows, separated by hairlines
 */
class MenuOverlayWindow : public QRasterWindow, public IMenuRouteHost {
    Q_OBJECT

public:
    static constexpr int kShowDurationMs = 220;
    static constexpr int kCloseDurationMs = 160;

    explicit MenuOverlayWindow(QWindow* parent = nullptr);
    ~MenuOverlayWindow() override;

    void setItems(std::vector<MenuItemSpec> items);
    void setActionsRow(std::vector<MenuItemSpec> items, SizeClassification size);

    // Ambient theme shared by all items; unset fields fall back to the defaults.
    void setTheme(const MenuItemTheme& theme);
    void setBrightness(Brightness brightness);
    void setTextScaleFactor(qreal factor);

    void showAt(const QPoint& globalPos);
    void showAtRightEdge(const QRect& parentRect);

    // Closes without resolving any action.
    void closeMenu();

    bool isMenuVisible() const { return m_Visible; }
    bool isClosing() const { return m_Closing; }

    int itemCount() const { return int(m_Items.size()); }
    int actionCount() const { return int(m_Actions.size()); }
    PullDownMenuItem* item(int index) const;
    PullDownMenuItem* action(int index) const;

    // Window-local geometry of an item / action row cell
    QRectF itemRect(int index) const;
    QRectF actionRect(int index) const;

    bool isSelectableGroup() const;

    // IMenuRouteHost
    void pop(MenuRouteResult result) override;
    int closeAnimationDurationMs() const override { return kCloseDurationMs; }

signals:
    void closed();

protected:
    void paintEvent(QPaintEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    bool event(QEvent* event) override;

private:
    MenuItemContext contextFor(SizeClassification size) const;
    void relayout();
    void showInternal(const QPoint& contentTopLeft);
    void finishClose();
    PullDownMenuItem* itemAtPos(const QPointF& pos) const;
    void setHoveredItem(PullDownMenuItem* item);

    std::vector<std::unique_ptr<PullDownMenuItem>> m_Items;
    std::vector<std::unique_ptr<PullDownMenuItem>> m_Actions;
    SizeClassification m_ActionSize;

    MenuItemTheme m_Theme;
    Brightness m_Brightness;
    qreal m_TextScaleFactor;

    PullDownMenuItem* m_HoveredItem;
    PullDownMenuItem* m_PressedItem;
    bool m_Visible;
    bool m_Closing;
    QMetaObject::Connection m_CloseConnection;

    // Layout (logical units, Qt auto-scales)
    int m_MenuWidth;
    int m_BorderRadius;
    int m_ShadowMargin;
    int m_ActionsRowSpacing;
    qreal m_ContentHeight;
    std::vector<QRectF> m_ItemRects;
    std::vector<QRectF> m_ActionRects;

    // Anti-flicker: grace period after show
    QElapsedTimer m_ShowTimer;

    QPropertyAnimation* m_OpacityAnim;
    QPropertyAnimation* m_SlideAnim;
    int m_TargetY;
};

}
