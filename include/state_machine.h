#pragma once

#include <memory>

namespace voice_relay {

/**
 * @brief Session turn state
 */
enum class State {
    Idle,          ///< Not listening, not speaking
    Listening,     ///< Audio buffered, turn detector running
    Transcribing,  ///< Utterance submitted, awaiting the final transcript
    Responding     ///< Agent call and synthesis in flight
};

const char* state_to_string(State state);

/**
 * @brief Turn lifecycle
 *
 * - Idle -> Listening (start_listening, or re-arm after a response in continuous mode)
 * - Listening -> Transcribing (qualifying speech stop, or stop_listening with speech)
 * - Listening -> Idle (stop_listening without qualifying speech)
 * - Transcribing -> Responding (non-empty final transcript)
 * - Transcribing -> Listening (empty transcript, or transcription failed)
 * - Responding -> Idle | Listening (response delivered; Listening when continuous)
 * - Responding -> Idle (agent or synthesis failed)
 * - any -> Idle (cancel, disconnect)
 *
 * Every method returns whether the event caused a transition; events that
 * do not apply to the current state leave it unchanged.
 */
class StateMachine {
public:
    StateMachine();
    ~StateMachine();

    State get_state() const;

    bool on_start_listening();
    bool on_turn_end();
    bool on_turn_discarded();
    bool on_transcript(bool empty);
    bool on_transcription_failed();
    bool on_response_complete(bool continuous);
    bool on_response_failed();
    bool on_cancel();

    /**
     * @brief Reset state machine to Idle
     */
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_relay
