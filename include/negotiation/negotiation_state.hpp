#ifndef PEERDROP_NEGOTIATION_STATE_HPP
#define PEERDROP_NEGOTIATION_STATE_HPP

#include <ostream>
#include <string>

namespace peerdrop {
namespace negotiation {

/**
 * NegotiationState tracks one offer/answer exchange and refuses illegal transitions.
 * The machine only moves forward; CLOSED and FAILED are terminal.
 */
class NegotiationState {
public:
    /**
     * Negotiation states:
     * IDLE                    - Nothing started yet
     * REGISTERING             - Registering the local peer id with the signaling server
     * WAITING_FOR_PEER        - Waiting for the remote offer (answerer) or answer (offerer)
     * EXCHANGING_DESCRIPTIONS - Applying the remote description, sending our own
     * GATHERING_CANDIDATES    - Trickling ICE candidates until the data channel opens
     * CONNECTED               - Data channel is open
     * CLOSED                  - Negotiation torn down after success
     * FAILED                  - Negotiation aborted, reachable from any non-terminal state
     */
    enum class State {
        IDLE,
        REGISTERING,
        WAITING_FOR_PEER,
        EXCHANGING_DESCRIPTIONS,
        GATHERING_CANDIDATES,
        CONNECTED,
        CLOSED,
        FAILED
    };

    /**
     * Initialize negotiation state to IDLE.
     */
    NegotiationState() : current_state_(State::IDLE) {}

    State get_state() const { return current_state_; }

    /**
     * Check if the current state is a terminal state (CLOSED or FAILED).
     * @return true if in terminal state
     */
    bool is_terminal() const {
        return current_state_ == State::CLOSED ||
               current_state_ == State::FAILED;
    }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    // Check if a transition is valid
    static bool is_valid_transition(State from, State to) {
        // Any live state may fail
        if (to == State::FAILED) {
            return from != State::CLOSED && from != State::FAILED;
        }

        switch (from) {
            case State::IDLE:
                return to == State::REGISTERING;

            case State::REGISTERING:
                // Offerer sends its offer right after registering
                return to == State::WAITING_FOR_PEER ||
                       to == State::CLOSED;

            case State::WAITING_FOR_PEER:
                return to == State::EXCHANGING_DESCRIPTIONS ||
                       to == State::CLOSED;

            case State::EXCHANGING_DESCRIPTIONS:
                return to == State::GATHERING_CANDIDATES ||
                       to == State::CLOSED;

            case State::GATHERING_CANDIDATES:
                return to == State::CONNECTED ||
                       to == State::CLOSED;

            case State::CONNECTED:
                return to == State::CLOSED;

            case State::CLOSED:
            case State::FAILED:
                return false;
        }
        return false;
    }

    // Convert state to string for logging
    static std::string state_to_string(State state) {
        switch (state) {
            case State::IDLE:                    return "IDLE";
            case State::REGISTERING:             return "REGISTERING";
            case State::WAITING_FOR_PEER:        return "WAITING_FOR_PEER";
            case State::EXCHANGING_DESCRIPTIONS: return "EXCHANGING_DESCRIPTIONS";
            case State::GATHERING_CANDIDATES:    return "GATHERING_CANDIDATES";
            case State::CONNECTED:               return "CONNECTED";
            case State::CLOSED:                  return "CLOSED";
            case State::FAILED:                  return "FAILED";
            default:                             return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for NegotiationState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const NegotiationState::State& state) {
    os << NegotiationState::state_to_string(state);
    return os;
}

} // namespace negotiation
} // namespace peerdrop

#endif // PEERDROP_NEGOTIATION_STATE_HPP
