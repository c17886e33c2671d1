#include "state_machine.h"

namespace voice_relay {

const char* state_to_string(State state) {
    switch (state) {
        case State::Idle: return "idle";
        case State::Listening: return "listening";
        case State::Transcribing: return "transcribing";
        case State::Responding: return "responding";
    }
    return "idle";
}

class StateMachine::Impl {
public:
    State get_state() const {
        return state_;
    }

    bool on_start_listening() {
        return move(State::Idle, State::Listening);
    }

    bool on_turn_end() {
        return move(State::Listening, State::Transcribing);
    }

    bool on_turn_discarded() {
        return move(State::Listening, State::Idle);
    }

    bool on_transcript(bool empty) {
        return move(State::Transcribing, empty ? State::Listening : State::Responding);
    }

    bool on_transcription_failed() {
        return move(State::Transcribing, State::Listening);
    }

    bool on_response_complete(bool continuous) {
        return move(State::Responding, continuous ? State::Listening : State::Idle);
    }

    bool on_response_failed() {
        return move(State::Responding, State::Idle);
    }

    bool on_cancel() {
        if (state_ == State::Idle) return false;
        state_ = State::Idle;
        return true;
    }

    void reset() {
        state_ = State::Idle;
    }

private:
    bool move(State from, State to) {
        if (state_ != from) return false;
        state_ = to;
        return true;
    }

    State state_ = State::Idle;
};

StateMachine::StateMachine() : pimpl_(std::make_unique<Impl>()) {}

StateMachine::~StateMachine() = default;

State StateMachine::get_state() const {
    return pimpl_->get_state();
}

bool StateMachine::on_start_listening() {
    return pimpl_->on_start_listening();
}

bool StateMachine::on_turn_end() {
    return pimpl_->on_turn_end();
}

bool StateMachine::on_turn_discarded() {
    return pimpl_->on_turn_discarded();
}

bool StateMachine::on_transcript(bool empty) {
    return pimpl_->on_transcript(empty);
}

bool StateMachine::on_transcription_failed() {
    return pimpl_->on_transcription_failed();
}

bool StateMachine::on_response_complete(bool continuous) {
    return pimpl_->on_response_complete(continuous);
}

bool StateMachine::on_response_failed() {
    return pimpl_->on_response_failed();
}

bool StateMachine::on_cancel() {
    return pimpl_->on_cancel();
}

void StateMachine::reset() {
    pimpl_->reset();
}

} // namespace voice_relay
