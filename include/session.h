#pragma once

/**
 * @file session.h
 * @brief One connected client's voice conversation
 *
 * A session owns its turn state and drives it from a single actor thread.
 * Client frames and provider results are posted to the actor's queue;
 * provider calls run on task threads and report back through that queue,
 * tagged with the turn they belong to so late results of a canceled turn
 * are dropped.
 */

#include "core/config.h"
#include "core/types.h"
#include "errors.h"
#include "llm/agent_backend.h"
#include "state_machine.h"
#include "stt/transcriber_interface.h"
#include "tts/tts_interface.h"
#include "vad/vad_interface.h"
#include <memory>
#include <string>

namespace voice_relay {

/**
 * @brief Outbound side of the client connection
 *
 * Only the session's actor thread calls these.
 */
class IClientChannel {
public:
    virtual ~IClientChannel() = default;

    /// Deliver one JSON text frame
    virtual void send(const std::string& frame) = 0;

    virtual void close(CloseCode code, const std::string& reason) = 0;
};

/**
 * @brief Provider instances a session works with
 *
 * Providers are shared between sessions and must be safe to call
 * concurrently.
 */
struct Providers {
    std::shared_ptr<stt::ITranscriber> transcriber;
    std::shared_ptr<stt::ITranscriber> fallback_transcriber;  ///< may be null
    std::shared_ptr<llm::IAgentBackend> agent;
    std::shared_ptr<tts::ISynthesizer> synthesizer;
    vad::VADFactory vad_factory;  ///< local turn detection model
};

struct SessionStats {
    uint64_t frames_received = 0;
    uint64_t protocol_errors = 0;
    uint64_t audio_chunks = 0;
    uint64_t chunks_ignored = 0;    ///< audio outside of listening
    uint64_t chunks_overflowed = 0;
    uint64_t turns_discarded = 0;   ///< speech too short to transcribe
    uint64_t responses_completed = 0;
};

class Session {
public:
    Session(std::string id,
            const Config& config,
            Providers providers,
            std::shared_ptr<IClientChannel> channel);

    /// Disconnects if still running and joins every thread
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Start the actor thread
    void start();

    /**
     * @brief Queue one raw client frame
     * @return false once the session is shutting down
     */
    bool post_client_frame(std::string raw);

    /**
     * @brief Client went away: cancel in-flight work silently and stop
     *
     * Returns immediately; wait() blocks until the actor has exited.
     */
    void disconnect();

    /// Block until the actor thread has exited
    void wait();

    /**
     * @brief Close the connection with a protocol close code and disconnect
     */
    void close(CloseCode code);

    const std::string& id() const;
    State state() const;
    bool continuous() const;
    bool running() const;

    /// Identity established by the transport's handshake, if any
    void set_principal(const std::string& principal);
    std::string principal() const;

    /// Milliseconds timestamp (now_ms clock) of the last client frame
    int64_t last_activity_ms() const;

    SessionStats stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace voice_relay
