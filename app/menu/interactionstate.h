#pragma once

#include <QObject>

namespace PullDown {

/**
 * InteractionStateMachine - pointer feedback state of a single item.
 *
 *   Idle --enter--> Hovered --press--> Pressed --release--> Hovered
 *     ^                |                  |
 *     +------leave-----+-------leave-------+
 *
 * A press without a prior hover (touch) goes straight from Idle to
 * Pressed. Disabled items stay in Idle and never activate.
 */
class InteractionStateMachine : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Hovered,
        Pressed,
    };
    Q_ENUM(State)

    explicit InteractionStateMachine(bool enabled = true, QObject* parent = nullptr);

    State state() const { return m_State; }
    bool isHovered() const { return m_State == State::Hovered; }
    bool isPressed() const { return m_State == State::Pressed; }

    bool isEnabled() const { return m_Enabled; }
    void setEnabled(bool enabled);

    void pointerEntered();
    void pointerLeft();
    void pointerPressed();

    // Returns true when the release completes a tap on this item.
    bool pointerReleased();

    // The press was taken over by someone else (e.g. a scroll gesture).
    void pointerCancelled();

    // Back to Idle without activation, used when the item is unmounted.
    void reset();

signals:
    void stateChanged(PullDown::InteractionStateMachine::State state);

private:
    void transitionTo(State state);

    State m_State;
    bool m_Enabled;
    bool m_PointerInside;
};

}
