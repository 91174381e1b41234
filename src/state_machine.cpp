/**
 * @file state_machine.cpp
 * @brief Device session state machine - Implementation
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 */

#include "state_machine.h"
#include "log.h"

// =============================================================================
// CONSTRUCTOR
// =============================================================================

SessionStateMachine::SessionStateMachine() :
    _currentState(SessionState::DISCONNECTED),
    _previousState(SessionState::DISCONNECTED),
    _tag(""),
    _callbackCount(0)
{
}

// =============================================================================
// INITIALIZATION
// =============================================================================

void SessionStateMachine::begin(SessionState initialState, const char* tag) {
    _currentState = initialState;
    _previousState = initialState;
    _tag = tag ? tag : "";
    LOG_DEBUG("STATE", "%s initialized: %s", _tag, sessionStateToString(_currentState));
}

// =============================================================================
// STATE TRANSITIONS
// =============================================================================

bool SessionStateMachine::transition(SessionTrigger trigger) {
    SessionState newState = determineNextState(trigger);

    if (newState == _currentState) {
        return false;
    }

    _previousState = _currentState;
    _currentState = newState;

    LOG_INFO("STATE", "%s %s -> %s [%s]", _tag,
             sessionStateToString(_previousState),
             sessionStateToString(_currentState),
             sessionTriggerToString(trigger));

    StateTransition trans(_previousState, _currentState, trigger);
    notifyCallbacks(trans);

    return true;
}

void SessionStateMachine::forceState(SessionState state, const char* reason) {
    if (_currentState == SessionState::DISPOSED || state == _currentState) {
        return;
    }

    _previousState = _currentState;
    _currentState = state;

    LOG_INFO("STATE", "%s FORCED: %s -> %s (%s)", _tag,
             sessionStateToString(_previousState),
             sessionStateToString(_currentState),
             reason ? reason : "-");

    StateTransition trans(_previousState, _currentState, SessionTrigger::FORCED, reason);
    notifyCallbacks(trans);
}

// =============================================================================
// CALLBACKS
// =============================================================================

bool SessionStateMachine::onStateChange(StateChangeCallback callback) {
    if (_callbackCount >= MAX_STATE_CALLBACKS) {
        LOG_WARN("STATE", "Max callbacks reached");
        return false;
    }

    _callbacks[_callbackCount++] = std::move(callback);
    return true;
}

void SessionStateMachine::clearCallbacks() {
    for (int i = 0; i < MAX_STATE_CALLBACKS; i++) {
        _callbacks[i] = nullptr;
    }
    _callbackCount = 0;
}

void SessionStateMachine::notifyCallbacks(const StateTransition& transition) {
    for (int i = 0; i < _callbackCount; i++) {
        if (_callbacks[i]) {
            _callbacks[i](transition);
        }
    }
}

// =============================================================================
// STATE TRANSITION LOGIC
// =============================================================================

SessionState SessionStateMachine::determineNextState(SessionTrigger trigger) const {
    SessionState current = _currentState;

    if (current == SessionState::DISPOSED) {
        return current;
    }

    switch (trigger) {
        // =====================================================================
        // LINK TRIGGERS
        // =====================================================================
        case SessionTrigger::CONNECT_REQUESTED:
            if (current == SessionState::DISCONNECTED || current == SessionState::ERROR) {
                return SessionState::CONNECTING;
            }
            break;

        case SessionTrigger::LINK_ESTABLISHED:
            if (current == SessionState::CONNECTING) {
                return SessionState::SERVICE_DISCOVERY;
            }
            break;

        case SessionTrigger::DISCOVERY_COMPLETE:
            if (current == SessionState::SERVICE_DISCOVERY) {
                return SessionState::CONNECTED;
            }
            break;

        case SessionTrigger::DISCONNECT_REQUESTED:
            if (isLinkedState(current) || current == SessionState::CONNECTING ||
                current == SessionState::ERROR) {
                return SessionState::DISCONNECTING;
            }
            break;

        case SessionTrigger::LINK_LOST:
            if (current != SessionState::DISCONNECTED) {
                return SessionState::DISCONNECTED;
            }
            break;

        // =====================================================================
        // STREAMING TRIGGERS
        // =====================================================================
        case SessionTrigger::STREAM_STARTED:
            if (current == SessionState::CONNECTED) {
                return SessionState::STREAMING;
            }
            break;

        case SessionTrigger::STREAM_STOPPED:
            if (current == SessionState::STREAMING) {
                return SessionState::CONNECTED;
            }
            break;

        // =====================================================================
        // FAILURE / TEARDOWN
        // =====================================================================
        case SessionTrigger::FAILURE:
            if (current == SessionState::CONNECTING ||
                current == SessionState::SERVICE_DISCOVERY ||
                current == SessionState::STREAMING) {
                return SessionState::ERROR;
            }
            break;

        case SessionTrigger::DISPOSE:
            return SessionState::DISPOSED;

        case SessionTrigger::FORCED:
            break;
    }

    return current;
}
