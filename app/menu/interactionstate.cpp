#include "interactionstate.h"

namespace PullDown {

InteractionStateMachine::InteractionStateMachine(bool enabled, QObject* parent)
    : QObject(parent),
      m_State(State::Idle),
      m_Enabled(enabled),
      m_PointerInside(false)
{
}

void InteractionStateMachine::setEnabled(bool enabled)
{
    if (m_Enabled == enabled)
        return;

    m_Enabled = enabled;
    if (!m_Enabled) {
        transitionTo(State::Idle);
    } else if (m_PointerInside) {
        transitionTo(State::Hovered);
    }
}

void InteractionStateMachine::pointerEntered()
{
    m_PointerInside = true;
    if (!m_Enabled)
        return;

    if (m_State == State::Idle)
        transitionTo(State::Hovered);
}

void InteractionStateMachine::pointerLeft()
{
    m_PointerInside = false;

    // Leaving cancels a pending press
    transitionTo(State::Idle);
}

void InteractionStateMachine::pointerPressed()
{
    if (!m_Enabled)
        return;

    m_PointerInside = true;
    transitionTo(State::Pressed);
}

bool InteractionStateMachine::pointerReleased()
{
    if (!m_Enabled || m_State != State::Pressed)
        return false;

    transitionTo(State::Hovered);
    return true;
}

void InteractionStateMachine::pointerCancelled()
{
    if (m_State != State::Pressed)
        return;

    transitionTo(m_PointerInside ? State::Hovered : State::Idle);
}

void InteractionStateMachine::reset()
{
    m_PointerInside = false;
    transitionTo(State::Idle);
}

void InteractionStateMachine::transitionTo(State state)
{
    if (m_State == state)
        return;

    m_State = state;
    emit stateChanged(m_State);
}

}
