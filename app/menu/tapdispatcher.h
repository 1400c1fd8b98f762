#pragma once

#include <functional>

#include "menuitemspec.h"
#include "menuitemtheme.h"

namespace PullDown {

using MenuRouteResult = std::function<void()>;

/**
 * Overlay that presents the menu and owns its close (pop) semantics.
 */
class IMenuRouteHost
{
public:
    virtual ~IMenuRouteHost() = default;

    // Starts closing the overlay and then calls result, if any. The close
    // animation may still be running when result is called.
    virtual void pop(MenuRouteResult result) = 0;

    // Duration of the close animation started by pop().
    virtual int closeAnimationDurationMs() const = 0;
};

/**
 * Everything an item reads from its surroundings. Supplied again on every
 * layout pass by whoever lays the item out.
 */
struct MenuItemContext {
    // Null when the item is not presented by a route host
    IMenuRouteHost* routeHost = nullptr;

    // Null when no ambient theme is installed
    const MenuItemTheme* ambientTheme = nullptr;

    Brightness brightness = Brightness::Light;
    SizeClassification size = SizeClassification::Full;
    qreal textScaleFactor = 1.0;

    // The enclosing group shows a checkmark column for all of its rows
    bool selectableGroup = false;
};

class TapDispatcher
{
public:
    // Runs onTap according to policy. Exceptions thrown by onTap are not
    // caught here. Only Immediate propagates them to the caller; under the pop
    // policies onTap may run from the Qt event loop and must not throw.
    static void activate(const MenuItemContext& context,
                         const std::function<void()>& onTap,
                         TapPolicy policy);
};

}
