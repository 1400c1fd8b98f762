#include "tapdispatcher.h"

#include <QDebug>
#include <QTimer>

namespace PullDown {

void TapDispatcher::activate(const MenuItemContext& context,
                             const std::function<void()>& onTap,
                             TapPolicy policy)
{
    if (!onTap)
        return;

    // Pop based policies need a route host to close; without one the
    // action runs in place.
    if (policy != TapPolicy::Immediate && context.routeHost == nullptr) {
        qDebug() << "[PullDownMenu] No route host, invoking tap immediately";
        policy = TapPolicy::Immediate;
    }

    switch (policy) {
    case TapPolicy::Immediate:
        onTap();
        break;

    case TapPolicy::PopThenInvoke:
        context.routeHost->pop(onTap);
        break;

    case TapPolicy::PopThenDelayedInvoke: {
        // The returned action only captures values, so it stays safe to run
        // after the item and the overlay are gone.
        const int delayMs = context.routeHost->closeAnimationDurationMs();
        std::function<void()> action = onTap;
        context.routeHost->pop([action, delayMs]() {
            QTimer::singleShot(delayMs, action);
        });
        break;
    }
    }
}

}
