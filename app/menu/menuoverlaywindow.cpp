#include "menuoverlaywindow.h"

#include <QScreen>
#include <QGuiApplication>
#include <QPainterPath>
#include <QCursor>
#include <QKeyEvent>
#include <QDebug>
#include <QtMath>

namespace PullDown {

MenuOverlayWindow::MenuOverlayWindow(QWindow* parent)
    : QRasterWindow(parent),
      m_ActionSize(SizeClassification::Standard),
      m_Brightness(Brightness::Light),
      m_TextScaleFactor(1.0),
      m_HoveredItem(nullptr),
      m_PressedItem(nullptr),
      m_Visible(false),
      m_Closing(false),
      m_ContentHeight(0),
      m_TargetY(0)
{
    setFlags(Qt::Tool | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint
             | Qt::WindowDoesNotAcceptFocus);

    QSurfaceFormat fmt;
    fmt.setAlphaBufferSize(8);
    setFormat(fmt);

    // Logical (unscaled) values, native pull-down menu proportions
    m_MenuWidth         = 250;
    m_BorderRadius      = 13;
    m_ShadowMargin      = 8;
    m_ActionsRowSpacing = 8;

    m_OpacityAnim = new QPropertyAnimation(this, "opacity", this);
    m_SlideAnim   = new QPropertyAnimation(this, "y", this);
}

MenuOverlayWindow::~MenuOverlayWindow()
{
}

// ---------------------------------------------------------------------------
// Menu contents
// ---------------------------------------------------------------------------

void MenuOverlayWindow::setItems(std::vector<MenuItemSpec> items)
{
    setHoveredItem(nullptr);
    m_PressedItem = nullptr;

    m_Items.clear();
    for (auto& spec : items) {
        m_Items.push_back(std::make_unique<PullDownMenuItem>(std::move(spec)));
    }
    relayout();
}

void MenuOverlayWindow::setActionsRow(std::vector<MenuItemSpec> items, SizeClassification size)
{
    setHoveredItem(nullptr);
    m_PressedItem = nullptr;

    // Rows only come in the two icon sizes
    m_ActionSize = (size == SizeClassification::Full) ? SizeClassification::Standard : size;

    m_Actions.clear();
    for (auto& spec : items) {
        m_Actions.push_back(std::make_unique<PullDownMenuItem>(std::move(spec)));
    }
    relayout();
}

void MenuOverlayWindow::setTheme(const MenuItemTheme& theme)
{
    m_Theme = theme;
    relayout();
}

void MenuOverlayWindow::setBrightness(Brightness brightness)
{
    m_Brightness = brightness;
    relayout();
}

void MenuOverlayWindow::setTextScaleFactor(qreal factor)
{
    m_TextScaleFactor = factor > 0 ? factor : 1.0;
    relayout();
}

PullDownMenuItem* MenuOverlayWindow::item(int index) const
{
    if (index < 0 || index >= (int)m_Items.size()) return nullptr;
    return m_Items[index].get();
}

PullDownMenuItem* MenuOverlayWindow::action(int index) const
{
    if (index < 0 || index >= (int)m_Actions.size()) return nullptr;
    return m_Actions[index].get();
}

QRectF MenuOverlayWindow::itemRect(int index) const
{
    if (index < 0 || index >= (int)m_ItemRects.size()) return QRectF();
    return m_ItemRects[index];
}

QRectF MenuOverlayWindow::actionRect(int index) const
{
    if (index < 0 || index >= (int)m_ActionRects.size()) return QRectF();
    return m_ActionRects[index];
}

bool MenuOverlayWindow::isSelectableGroup() const
{
    for (const auto& item : m_Items) {
        if (item->spec().selected.has_value())
            return true;
    }
    return false;
}

MenuItemContext MenuOverlayWindow::contextFor(SizeClassification size) const
{
    MenuItemContext context;
    context.routeHost = const_cast<MenuOverlayWindow*>(this);
    context.ambientTheme = &m_Theme;
    context.brightness = m_Brightness;
    context.size = size;
    context.textScaleFactor = m_TextScaleFactor;
    context.selectableGroup = isSelectableGroup();
    return context;
}

void MenuOverlayWindow::relayout()
{
    m_ItemRects.clear();
    m_ActionRects.clear();

    const qreal sm = m_ShadowMargin;
    qreal y = 0;

    if (!m_Actions.empty()) {
        const MenuItemContext context = contextFor(m_ActionSize);
        const qreal cellWidth = qreal(m_MenuWidth) / m_Actions.size();

        qreal rowHeight = 0;
        for (auto& action : m_Actions) {
            action->build(context, cellWidth);
            rowHeight = qMax(rowHeight, action->size().height());
        }
        for (int i = 0; i < (int)m_Actions.size(); i++) {
            m_ActionRects.push_back(QRectF(sm + i * cellWidth, sm + y, cellWidth, rowHeight));
        }

        y += rowHeight;
        if (!m_Items.empty())
            y += m_ActionsRowSpacing;
    }

    const MenuItemContext context = contextFor(SizeClassification::Full);
    for (auto& item : m_Items) {
        item->build(context, m_MenuWidth);
        m_ItemRects.push_back(QRectF(QPointF(sm, sm + y), item->size()));
        y += item->size().height();
    }

    m_ContentHeight = y;
    resize(m_MenuWidth + 2 * m_ShadowMargin, qCeil(m_ContentHeight) + 2 * m_ShadowMargin);
    requestUpdate();
}

// ---------------------------------------------------------------------------
// Show / hide
// ---------------------------------------------------------------------------

void MenuOverlayWindow::showAt(const QPoint& globalPos)
{
    QPoint topLeft = globalPos;

    // Keep the content on screen
    if (QScreen* s = screen()) {
        const QRect avail = s->availableGeometry();
        const int contentHeight = qCeil(m_ContentHeight);
        if (topLeft.x() + m_MenuWidth > avail.right()) topLeft.setX(avail.right() - m_MenuWidth);
        if (topLeft.x() < avail.left()) topLeft.setX(avail.left());
        if (topLeft.y() + contentHeight > avail.bottom()) topLeft.setY(avail.bottom() - contentHeight);
        if (topLeft.y() < avail.top()) topLeft.setY(avail.top());
    }

    showInternal(topLeft);
}

void MenuOverlayWindow::showAtRightEdge(const QRect& parentRect)
{
    showInternal(QPoint(parentRect.x() + parentRect.width() - m_MenuWidth, parentRect.y()));
}

void MenuOverlayWindow::showInternal(const QPoint& contentTopLeft)
{
    setHoveredItem(nullptr);
    m_PressedItem = nullptr;

    // If closing animation is in progress, cancel it. stop() does not emit
    // finished, so the pending close has to be disconnected by hand.
    if (m_Closing) {
        disconnect(m_CloseConnection);
        m_OpacityAnim->stop();
        m_SlideAnim->stop();
        m_Closing = false;
    }

    m_Visible = true;
    m_ShowTimer.start();

    relayout();
    m_TargetY = contentTopLeft.y() - m_ShadowMargin;

    int slideDistance = 12;
    setPosition(contentTopLeft.x() - m_ShadowMargin, m_TargetY - slideDistance);
    setOpacity(0.0);

    show();
    raise();

    m_SlideAnim->setDuration(kShowDurationMs);
    m_SlideAnim->setStartValue(m_TargetY - slideDistance);
    m_SlideAnim->setEndValue(m_TargetY);
    m_SlideAnim->setEasingCurve(QEasingCurve::OutCubic);

    m_OpacityAnim->setDuration(kShowDurationMs);
    m_OpacityAnim->setStartValue(0.0);
    m_OpacityAnim->setEndValue(1.0);
    m_OpacityAnim->setEasingCurve(QEasingCurve::OutCubic);

    m_SlideAnim->start();
    m_OpacityAnim->start();

    qInfo() << "[PullDownMenu] Showing menu with" << m_Items.size() << "items and"
            << m_Actions.size() << "row actions";

    requestUpdate();
}

void MenuOverlayWindow::closeMenu()
{
    if (!m_Visible) return;
    if (m_Closing) return;  // already animating close

    m_Visible = false;
    m_Closing = true;
    setHoveredItem(nullptr);
    m_PressedItem = nullptr;
    for (auto& item : m_Items) item->interaction().reset();
    for (auto& action : m_Actions) action->interaction().reset();

    m_SlideAnim->stop();
    m_OpacityAnim->stop();

    // Slide back up while fading out
    int slideDistance = 12;
    m_SlideAnim->setDuration(kCloseDurationMs);
    m_SlideAnim->setStartValue(y());
    m_SlideAnim->setEndValue(y() - slideDistance);
    m_SlideAnim->setEasingCurve(QEasingCurve::InCubic);

    m_OpacityAnim->setDuration(kCloseDurationMs);
    m_OpacityAnim->setStartValue(opacity());
    m_OpacityAnim->setEndValue(0.0);
    m_OpacityAnim->setEasingCurve(QEasingCurve::InCubic);

    // When fade-out completes, finalize (use disconnect to emulate single-shot for Qt 5 compat)
    disconnect(m_CloseConnection);
    m_CloseConnection = connect(m_OpacityAnim, &QPropertyAnimation::finished, this, [this]() {
        disconnect(m_CloseConnection);
        if (!m_Closing) return;
        finishClose();
    });

    m_SlideAnim->start();
    m_OpacityAnim->start();
}

void MenuOverlayWindow::pop(MenuRouteResult result)
{
    if (m_Closing) {
        qWarning() << "[PullDownMenu] Menu is already closing, dropping popped action";
        return;
    }

    qInfo() << "[PullDownMenu] Route popped" << (result ? "with an action" : "without an action");

    if (m_Visible) {
        closeMenu();
    } else {
        // Nothing to animate
        finishClose();
    }

    // The route resolves as soon as the close starts; the menu may still be
    // animating out while the action runs.
    if (result) {
        result();
    }
}

void MenuOverlayWindow::finishClose()
{
    m_Closing = false;
    hide();
    setOpacity(1.0);   // reset for next show

    qInfo() << "[PullDownMenu] Menu closed";
    emit closed();
}

// ---------------------------------------------------------------------------
// Painting
// ---------------------------------------------------------------------------

void MenuOverlayWindow::paintEvent(QPaintEvent*)
{
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);
    p.setRenderHint(QPainter::TextAntialiasing);

    const bool dark = m_Brightness == Brightness::Dark;
    int w = width();
    int h = height();
    int sm = m_ShadowMargin;
    int cw = w - 2 * sm;   // content width
    int ch = h - 2 * sm;   // content height

    // Clear to transparent
    p.setCompositionMode(QPainter::CompositionMode_Source);
    p.fillRect(0, 0, w, h, Qt::transparent);
    p.setCompositionMode(QPainter::CompositionMode_SourceOver);

    // === Soft drop shadow ===
    for (int i = sm; i >= 1; i--) {
        qreal t = 1.0 - (qreal)i / sm;
        int alpha = qRound(28.0 * t * t);
        QPainterPath sp;
        sp.addRoundedRect(QRectF(sm - i, sm - i + 1, cw + 2 * i, ch + 2 * i),
                          m_BorderRadius + i, m_BorderRadius + i);
        p.fillPath(sp, QColor(0, 0, 0, alpha));
    }

    // === Blurred-material stand-in ===
    QPainterPath bgPath;
    bgPath.addRoundedRect(QRectF(sm, sm, cw, ch), m_BorderRadius, m_BorderRadius);
    p.fillPath(bgPath, dark ? QColor(37, 37, 37, 242) : QColor(249, 249, 249, 242));

    p.setClipPath(bgPath);

    const QColor hairline = dark ? QColor(255, 255, 255, 28) : QColor(0, 0, 0, 36);
    const QColor thickSeparator = dark ? QColor(0, 0, 0, 80) : QColor(0, 0, 0, 20);

    // --- Actions row ---
    for (int i = 0; i < (int)m_Actions.size(); i++) {
        const QRectF& rect = m_ActionRects[i];
        m_Actions[i]->paint(&p, rect.topLeft());

        if (i > 0) {
            p.setPen(QPen(hairline, 0.5));
            p.drawLine(QPointF(rect.left(), rect.top()), QPointF(rect.left(), rect.bottom()));
        }
    }
    if (!m_Actions.empty() && !m_Items.empty()) {
        const qreal top = m_ActionRects.front().bottom();
        p.fillRect(QRectF(sm, top, cw, m_ActionsRowSpacing), thickSeparator);
    }

    // --- Item list ---
    for (int i = 0; i < (int)m_Items.size(); i++) {
        const QRectF& rect = m_ItemRects[i];
        m_Items[i]->paint(&p, rect.topLeft());

        if (i < (int)m_Items.size() - 1) {
            p.setPen(QPen(hairline, 0.5));
            p.drawLine(QPointF(rect.left(), rect.bottom()), QPointF(rect.right(), rect.bottom()));
        }
    }
}

// ---------------------------------------------------------------------------
// Mouse input
// ---------------------------------------------------------------------------

PullDownMenuItem* MenuOverlayWindow::itemAtPos(const QPointF& pos) const
{
    for (int i = 0; i < (int)m_ActionRects.size(); i++) {
        if (m_ActionRects[i].contains(pos)) return m_Actions[i].get();
    }
    for (int i = 0; i < (int)m_ItemRects.size(); i++) {
        if (m_ItemRects[i].contains(pos)) return m_Items[i].get();
    }
    return nullptr;
}

void MenuOverlayWindow::setHoveredItem(PullDownMenuItem* item)
{
    if (item == m_HoveredItem) return;

    if (m_HoveredItem) m_HoveredItem->hoverLeft();
    m_HoveredItem = item;
    if (m_HoveredItem) m_HoveredItem->hoverEntered();

    setCursor((m_HoveredItem && m_HoveredItem->isInteractive()) ? Qt::PointingHandCursor : Qt::ArrowCursor);
    requestUpdate();
}

void MenuOverlayWindow::mouseMoveEvent(QMouseEvent* event)
{
    if (m_Closing) return;

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    setHoveredItem(itemAtPos(event->position()));
#else
    setHoveredItem(itemAtPos(event->localPos()));
#endif
}

void MenuOverlayWindow::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || m_Closing) return;

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    PullDownMenuItem* item = itemAtPos(event->position());
#else
    PullDownMenuItem* item = itemAtPos(event->localPos());
#endif
    if (item == nullptr) return;

    setHoveredItem(item);
    m_PressedItem = item;
    item->pressed();
    requestUpdate();
}

void MenuOverlayWindow::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) return;

    PullDownMenuItem* pressedItem = m_PressedItem;
    m_PressedItem = nullptr;
    if (pressedItem == nullptr) return;

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    PullDownMenuItem* item = itemAtPos(event->position());
#else
    PullDownMenuItem* item = itemAtPos(event->localPos());
#endif

    requestUpdate();

    if (item != pressedItem) {
        pressedItem->interaction().pointerCancelled();
        return;
    }

    // May pop this window or run the action right here
    pressedItem->released();
}

void MenuOverlayWindow::keyPressEvent(QKeyEvent* event)
{
    if (event->key() == Qt::Key_Escape) {
        closeMenu();
        return;
    }
    QRasterWindow::keyPressEvent(event);
}

bool MenuOverlayWindow::event(QEvent* ev)
{
    if (ev->type() == QEvent::Leave) {
        setHoveredItem(nullptr);
        if (m_Visible) {
            // Grace period: ignore Leave within 300ms of showing
            if (m_ShowTimer.elapsed() < 300) {
                return true;
            }
            // Verify cursor is actually outside (cursor warp may lag)
            QPoint globalPos = QCursor::pos();
            if (geometry().contains(globalPos)) {
                return true;
            }
            closeMenu();
        }
        return true;
    }
    return QRasterWindow::event(ev);
}

}
