/**
 * @file state_machine.h
 * @brief Device session state machine - State management and transitions
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 *
 * Implements the lifecycle of one sensor session:
 * - State tracking (DISCONNECTED, CONNECTING, SERVICE_DISCOVERY, ...)
 * - Event-driven transitions via triggers
 * - Listener notification on state changes
 * - Force state for teardown paths
 * - DISPOSED is terminal: no trigger or force leaves it
 */

#ifndef STATE_MACHINE_H
#define STATE_MACHINE_H

#include "types.h"
#include <functional>

// =============================================================================
// CONSTANTS
// =============================================================================

#define MAX_STATE_CALLBACKS 4

// =============================================================================
// STATE TRANSITION
// =============================================================================

/**
 * @brief Represents a state transition event
 */
struct StateTransition {
    SessionState fromState;
    SessionState toState;
    SessionTrigger trigger;
    const char* reason;  // Optional reason for forced transitions

    StateTransition() :
        fromState(SessionState::DISCONNECTED),
        toState(SessionState::DISCONNECTED),
        trigger(SessionTrigger::FORCED),
        reason(nullptr) {}

    StateTransition(SessionState from, SessionState to, SessionTrigger trig, const char* rsn = nullptr) :
        fromState(from),
        toState(to),
        trigger(trig),
        reason(rsn) {}
};

// =============================================================================
// CALLBACK TYPES
// =============================================================================

/**
 * @brief Callback function type for state change notifications
 */
typedef std::function<void(const StateTransition& transition)> StateChangeCallback;

// =============================================================================
// SESSION STATE MACHINE
// =============================================================================

/**
 * @brief Manages session state transitions
 *
 * Transition table:
 *   DISCONNECTED      --CONNECT_REQUESTED-->    CONNECTING
 *   CONNECTING        --LINK_ESTABLISHED-->     SERVICE_DISCOVERY
 *   SERVICE_DISCOVERY --DISCOVERY_COMPLETE-->   CONNECTED
 *   CONNECTED         --STREAM_STARTED-->       STREAMING
 *   STREAMING         --STREAM_STOPPED-->       CONNECTED
 *   linked states     --DISCONNECT_REQUESTED--> DISCONNECTING
 *   DISCONNECTING     --LINK_LOST-->            DISCONNECTED
 *   linked/connecting --LINK_LOST-->            DISCONNECTED
 *   CONNECTING/SERVICE_DISCOVERY/STREAMING --FAILURE--> ERROR
 *   ERROR             --CONNECT_REQUESTED-->    CONNECTING
 *   ERROR             --LINK_LOST-->            DISCONNECTED
 *   any               --DISPOSE-->              DISPOSED
 *
 * Usage:
 *   SessionStateMachine machine;
 *   machine.begin();
 *   machine.onStateChange([](const StateTransition& t) { ... });
 *   machine.transition(SessionTrigger::CONNECT_REQUESTED);
 */
class SessionStateMachine {
public:
    SessionStateMachine();

    /**
     * @brief Initialize state machine with starting state
     * @param initialState Starting state (default: DISCONNECTED)
     * @param tag Device name used in log lines
     */
    void begin(SessionState initialState = SessionState::DISCONNECTED, const char* tag = "");

    SessionState getCurrentState() const { return _currentState; }
    SessionState getPreviousState() const { return _previousState; }

    /**
     * @brief Trigger a state transition
     * @return true if transition occurred, false if no valid transition
     */
    bool transition(SessionTrigger trigger);

    /**
     * @brief Force the state machine to a specific state
     *
     * Bypasses the transition table. Ignored once DISPOSED.
     */
    void forceState(SessionState state, const char* reason = nullptr);

    // =========================================================================
    // CALLBACKS
    // =========================================================================

    /**
     * @brief Register callback for state change events
     * @return true if callback registered, false if max callbacks reached
     */
    bool onStateChange(StateChangeCallback callback);

    void clearCallbacks();

    // =========================================================================
    // STATE CHECKS
    // =========================================================================

    bool isLinked() const { return isLinkedState(_currentState); }
    bool isStreaming() const { return _currentState == SessionState::STREAMING; }
    bool isConnected() const { return _currentState == SessionState::CONNECTED; }
    bool isDisposed() const { return _currentState == SessionState::DISPOSED; }
    bool isError() const { return _currentState == SessionState::ERROR; }

private:
    SessionState _currentState;
    SessionState _previousState;
    const char* _tag;

    StateChangeCallback _callbacks[MAX_STATE_CALLBACKS];
    uint8_t _callbackCount;

    /**
     * @brief Determine next state based on current state and trigger
     * @return New state (same as current if no valid transition)
     */
    SessionState determineNextState(SessionTrigger trigger) const;

    void notifyCallbacks(const StateTransition& transition);
};

#endif // STATE_MACHINE_H
