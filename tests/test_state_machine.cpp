/**
 * Turn lifecycle transitions, including events that arrive in the wrong
 * state and must be ignored.
 *
 * Run from build dir: ./test_state_machine
 */

#include "state_machine.h"
#include <cstring>
#include <iostream>

using namespace voice_relay;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- Full turn, one-shot ---
    {
        StateMachine sm;
        ASSERT(sm.get_state() == State::Idle);
        ASSERT(sm.on_start_listening());
        ASSERT(sm.get_state() == State::Listening);
        ASSERT(sm.on_turn_end());
        ASSERT(sm.get_state() == State::Transcribing);
        ASSERT(sm.on_transcript(false));
        ASSERT(sm.get_state() == State::Responding);
        ASSERT(sm.on_response_complete(false));
        ASSERT(sm.get_state() == State::Idle);
    }

    // --- Continuous re-arm ---
    {
        StateMachine sm;
        sm.on_start_listening();
        sm.on_turn_end();
        sm.on_transcript(false);
        ASSERT(sm.on_response_complete(true));
        ASSERT(sm.get_state() == State::Listening);
    }

    // --- Empty transcript and transcription failure return to listening ---
    {
        StateMachine sm;
        sm.on_start_listening();
        sm.on_turn_end();
        ASSERT(sm.on_transcript(true));
        ASSERT(sm.get_state() == State::Listening);

        sm.on_turn_end();
        ASSERT(sm.on_transcription_failed());
        ASSERT(sm.get_state() == State::Listening);
    }

    // --- Discarded turn and failed response go idle ---
    {
        StateMachine sm;
        sm.on_start_listening();
        ASSERT(sm.on_turn_discarded());
        ASSERT(sm.get_state() == State::Idle);

        sm.on_start_listening();
        sm.on_turn_end();
        sm.on_transcript(false);
        ASSERT(sm.on_response_failed());
        ASSERT(sm.get_state() == State::Idle);
    }

    // --- Events that do not apply are ignored ---
    {
        StateMachine sm;
        ASSERT(!sm.on_turn_end());
        ASSERT(!sm.on_transcript(false));
        ASSERT(!sm.on_response_complete(true));
        ASSERT(!sm.on_cancel());
        ASSERT(sm.get_state() == State::Idle);

        sm.on_start_listening();
        ASSERT(!sm.on_start_listening());
        ASSERT(!sm.on_response_failed());
        ASSERT(!sm.on_transcription_failed());
        ASSERT(sm.get_state() == State::Listening);

        sm.on_turn_end();
        ASSERT(!sm.on_turn_discarded());
        ASSERT(!sm.on_start_listening());
        ASSERT(sm.get_state() == State::Transcribing);
    }

    // --- Cancel from every busy state ---
    {
        StateMachine sm;
        sm.on_start_listening();
        ASSERT(sm.on_cancel());
        ASSERT(sm.get_state() == State::Idle);

        sm.on_start_listening();
        sm.on_turn_end();
        ASSERT(sm.on_cancel());
        ASSERT(sm.get_state() == State::Idle);

        sm.on_start_listening();
        sm.on_turn_end();
        sm.on_transcript(false);
        ASSERT(sm.on_cancel());
        ASSERT(sm.get_state() == State::Idle);
    }

    // --- reset ---
    {
        StateMachine sm;
        sm.on_start_listening();
        sm.on_turn_end();
        sm.reset();
        ASSERT(sm.get_state() == State::Idle);
    }

    ASSERT(std::strcmp(state_to_string(State::Transcribing), "transcribing") == 0);
    ASSERT(std::strcmp(state_to_string(State::Responding), "responding") == 0);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All state machine tests passed.\n";
    return 0;
}
