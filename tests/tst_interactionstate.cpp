#include <QtTest>
#include <QSignalSpy>

#include "menu/interactionstate.h"

using namespace PullDown;

using State = InteractionStateMachine::State;

class TestInteractionState : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void hoverPressRelease();
    void releaseWithoutPressDoesNotActivate();
    void leaveCancelsPress();
    void touchPressSkipsHover();
    void cancelReturnsToHover();
    void disabledStaysIdle();
    void disablingResetsState();
    void reenablingRestoresHover();
    void resetDropsPointer();
    void signalsOnlyOnChange();
};

void TestInteractionState::initTestCase()
{
    qRegisterMetaType<InteractionStateMachine::State>();
}

void TestInteractionState::hoverPressRelease()
{
    InteractionStateMachine machine;
    QCOMPARE(machine.state(), State::Idle);

    machine.pointerEntered();
    QVERIFY(machine.isHovered());

    machine.pointerPressed();
    QVERIFY(machine.isPressed());

    QVERIFY(machine.pointerReleased());
    QCOMPARE(machine.state(), State::Hovered);

    machine.pointerLeft();
    QCOMPARE(machine.state(), State::Idle);
}

void TestInteractionState::releaseWithoutPressDoesNotActivate()
{
    InteractionStateMachine machine;
    machine.pointerEntered();

    QVERIFY(!machine.pointerReleased());
    QCOMPARE(machine.state(), State::Hovered);
}

void TestInteractionState::leaveCancelsPress()
{
    InteractionStateMachine machine;
    machine.pointerEntered();
    machine.pointerPressed();
    machine.pointerLeft();

    QCOMPARE(machine.state(), State::Idle);
    QVERIFY(!machine.pointerReleased());
}

void TestInteractionState::touchPressSkipsHover()
{
    InteractionStateMachine machine;
    machine.pointerPressed();
    QCOMPARE(machine.state(), State::Pressed);

    QVERIFY(machine.pointerReleased());
}

void TestInteractionState::cancelReturnsToHover()
{
    InteractionStateMachine machine;
    machine.pointerEntered();
    machine.pointerPressed();
    machine.pointerCancelled();

    QCOMPARE(machine.state(), State::Hovered);
    QVERIFY(!machine.pointerReleased());
}

void TestInteractionState::disabledStaysIdle()
{
    InteractionStateMachine machine(false);

    machine.pointerEntered();
    QCOMPARE(machine.state(), State::Idle);

    machine.pointerPressed();
    QCOMPARE(machine.state(), State::Idle);

    QVERIFY(!machine.pointerReleased());
}

void TestInteractionState::disablingResetsState()
{
    InteractionStateMachine machine;
    machine.pointerEntered();
    machine.pointerPressed();

    machine.setEnabled(false);
    QVERIFY(!machine.isEnabled());
    QCOMPARE(machine.state(), State::Idle);
    QVERIFY(!machine.pointerReleased());
}

void TestInteractionState::reenablingRestoresHover()
{
    InteractionStateMachine machine(false);
    machine.pointerEntered();
    QCOMPARE(machine.state(), State::Idle);

    machine.setEnabled(true);
    QCOMPARE(machine.state(), State::Hovered);
}

void TestInteractionState::resetDropsPointer()
{
    InteractionStateMachine machine;
    machine.pointerEntered();
    machine.reset();
    QCOMPARE(machine.state(), State::Idle);

    // Pointer is no longer considered inside
    machine.setEnabled(false);
    machine.setEnabled(true);
    QCOMPARE(machine.state(), State::Idle);
}

void TestInteractionState::signalsOnlyOnChange()
{
    InteractionStateMachine machine;
    QSignalSpy spy(&machine, &InteractionStateMachine::stateChanged);

    machine.pointerEntered();
    machine.pointerEntered();
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<InteractionStateMachine::State>(), State::Hovered);

    machine.pointerPressed();
    machine.pointerReleased();
    QCOMPARE(spy.count(), 3);

    machine.pointerLeft();
    machine.pointerLeft();
    QCOMPARE(spy.count(), 4);
    QCOMPARE(spy.last().at(0).value<InteractionStateMachine::State>(), State::Idle);
}

QTEST_MAIN(TestInteractionState)
#include "tst_interactionstate.moc"
