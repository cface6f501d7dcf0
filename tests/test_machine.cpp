#include <gtest/gtest.h>
#include "automaton/machine.hpp"
#include "common/errors.hpp"

using namespace obix;

namespace {

/// Accepts strings over {a, b} that end in "b".
Machine endsInB() {
    Machine m;
    StateId s0 = m.addState("s0");
    StateId s1 = m.addState("s1", "", true);
    m.addTransition(s0, "a", s0);
    m.addTransition(s0, "b", s1);
    m.addTransition(s1, "a", s0);
    m.addTransition(s1, "b", s1);
    return m;
}

} // namespace

// ─── States ────────────────────────────────────────────────────

TEST(MachineTest, FirstStateBecomesInitialAndCurrent) {
    Machine m;
    EXPECT_FALSE(m.hasCurrentState());
    StateId s0 = m.addState("s0", "payload");
    m.addState("s1");

    EXPECT_EQ(m.initialState(), s0);
    EXPECT_EQ(m.currentState(), s0);
    EXPECT_EQ(m.getState(s0)->value, "payload");
}

TEST(MachineTest, NamedConstructorCreatesInitialState) {
    Machine m("start");
    ASSERT_EQ(m.stateCount(), 1);
    auto id = m.findState("start");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(m.initialState(), *id);
}

TEST(MachineTest, DuplicateNameOrIdThrows) {
    Machine m;
    StateId s0 = m.addState("s0");
    EXPECT_THROW(m.addState("s0"), std::runtime_error);
    EXPECT_THROW(m.addStateWithId(s0, "other"), std::runtime_error);
    EXPECT_THROW(m.addStateWithId(kNoState, "zero"), std::runtime_error);
}

TEST(MachineTest, RemoveStateDropsIncomingTransitions) {
    Machine m = endsInB();
    StateId s1 = *m.findState("s1");
    StateId s0 = *m.findState("s0");
    ASSERT_TRUE(m.removeState(s1));

    EXPECT_EQ(m.stateCount(), 1);
    EXPECT_FALSE(m.target(s0, "b").has_value());
    EXPECT_EQ(m.alphabet(), (std::set<std::string>{"a"}));
}

// ─── Transitions ───────────────────────────────────────────────

TEST(MachineTest, TransitionMovesCursor) {
    Machine m = endsInB();
    const State& s = m.transition("b");
    EXPECT_EQ(s.name, "s1");
    EXPECT_EQ(m.currentState(), *m.findState("s1"));
}

TEST(MachineTest, UndefinedTransitionThrows) {
    Machine m = endsInB();
    try {
        m.transition("c");
        FAIL() << "expected UndefinedTransitionError";
    } catch (const UndefinedTransitionError& e) {
        EXPECT_EQ(e.label(), "c");
        EXPECT_EQ(e.stateName(), "s0");
    }
    // Cursor stays put
    EXPECT_EQ(m.currentState(), m.initialState());
}

TEST(MachineTest, TransitionWithoutCursorThrows) {
    Machine m;
    EXPECT_THROW(m.transition("a"), NoCurrentStateError);
}

TEST(MachineTest, CountTransitionsAndAlphabet) {
    Machine m = endsInB();
    EXPECT_EQ(m.countTransitions(), 4);
    EXPECT_EQ(m.alphabet(), (std::set<std::string>{"a", "b"}));

    EXPECT_TRUE(m.removeTransition(*m.findState("s0"), "a"));
    EXPECT_EQ(m.countTransitions(), 3);
}

TEST(MachineTest, AddTransitionByName) {
    Machine m;
    m.addState("x");
    m.addState("y");
    m.addTransitionByName("x", "go", "y");
    EXPECT_EQ(m.target(*m.findState("x"), "go"), m.findState("y"));
    EXPECT_THROW(m.addTransitionByName("x", "go", "missing"), std::runtime_error);
}

TEST(MachineTest, RevisionChangesOnMutation) {
    Machine m = endsInB();
    uint64_t before = m.revision();
    m.addTransition(*m.findState("s0"), "c", *m.findState("s0"));
    EXPECT_GT(m.revision(), before);
}

// ─── Sequences ─────────────────────────────────────────────────

TEST(MachineTest, ProcessSequenceResetsFirst) {
    Machine m = endsInB();
    m.transition("b");
    const State& end = m.processSequence({"a", "a"});
    EXPECT_EQ(end.name, "s0");
}

TEST(MachineTest, Accepts) {
    Machine m = endsInB();
    EXPECT_TRUE(m.accepts({"a", "b"}));
    EXPECT_FALSE(m.accepts({"b", "a"}));
    EXPECT_FALSE(m.accepts({"a", "c"}));  // undefined label is a rejection
}

TEST(MachineTest, ResetToState) {
    Machine m = endsInB();
    m.resetToState("s1");
    EXPECT_EQ(m.currentState(), *m.findState("s1"));
    EXPECT_THROW(m.resetToState("nope"), std::runtime_error);
    m.reset();
    EXPECT_EQ(m.currentState(), m.initialState());
}

// ─── Reachability ──────────────────────────────────────────────

TEST(MachineTest, ReachableStatesInBreadthFirstOrder) {
    Machine m;
    StateId a = m.addState("a");
    StateId b = m.addState("b");
    StateId c = m.addState("c");
    StateId orphan = m.addState("orphan");
    m.addTransition(a, "x", b);
    m.addTransition(b, "x", c);
    m.addTransition(orphan, "x", a);

    EXPECT_EQ(m.reachableStates(), (std::vector<StateId>{a, b, c}));
    EXPECT_EQ(m.removeUnreachableStates(), 1);
    EXPECT_FALSE(m.hasState(orphan));
}

// ─── Graph view ────────────────────────────────────────────────

TEST(MachineTest, SignatureReflectsAcceptanceAndValue) {
    Machine m;
    StateId a = m.addState("a", "v");
    StateId b = m.addState("b", "v", true);
    StateId c = m.addState("c", "v");
    EXPECT_NE(m.signature(a), m.signature(b));
    EXPECT_EQ(m.signature(a), m.signature(c));
    EXPECT_THROW(m.signature(42), StructuralError);
}

TEST(MachineTest, CopiesAreIndependent) {
    Machine m = endsInB();
    Machine copy = m;
    copy.addState("extra");
    copy.transition("b");
    EXPECT_EQ(m.stateCount(), 2);
    EXPECT_EQ(m.currentState(), m.initialState());
}
