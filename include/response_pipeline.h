#pragma once

/**
 * @file response_pipeline.h
 * @brief Agent reply -> sentence units -> speech frames for one turn
 *
 * Runs on a task thread. Unit text is reported before the unit is queued
 * for synthesis, so a unit's text always precedes its audio.
 */

#include "core/types.h"
#include "core/cancel_token.h"
#include "llm/agent_backend.h"
#include "response_streamer.h"
#include "synthesis_scheduler.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace voice_relay {

struct PipelineConfig {
    size_t max_unit_chars = constants::session::MAX_UNIT_CHARS;
    SchedulerConfig scheduler;
};

using UnitSink = std::function<void(const ResponseUnit& unit)>;

struct ResponseOutcome {
    std::string text;       ///< agent text received, complete on success
    size_t units = 0;       ///< units handed to synthesis
    VoidResult status = VoidResult::ok_result();
};

class ResponsePipeline {
public:
    ResponsePipeline(std::shared_ptr<llm::IAgentBackend> agent,
                     std::shared_ptr<tts::ISynthesizer> synthesizer,
                     const PipelineConfig& config);

    /**
     * @brief Stream one reply and deliver its audio
     *
     * Returns after every unit's frames reached `on_frame`, or after the
     * first failure. An agent failure stops synthesis at once; a synthesis
     * failure lets earlier units finish and stops reading the agent.
     */
    ResponseOutcome run(const std::vector<Message>& messages,
                        const CancelTokenPtr& cancel,
                        const UnitSink& on_unit,
                        const FrameSink& on_frame);

private:
    std::shared_ptr<llm::IAgentBackend> agent_;
    std::shared_ptr<tts::ISynthesizer> synthesizer_;
    PipelineConfig config_;
};

} // namespace voice_relay
