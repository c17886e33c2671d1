#include "response_pipeline.h"
#include "logger.h"
#include "text_sanitizer.h"

namespace voice_relay {

ResponsePipeline::ResponsePipeline(std::shared_ptr<llm::IAgentBackend> agent,
                                   std::shared_ptr<tts::ISynthesizer> synthesizer,
                                   const PipelineConfig& config)
    : agent_(std::move(agent)),
      synthesizer_(std::move(synthesizer)),
      config_(config) {}

ResponseOutcome ResponsePipeline::run(const std::vector<Message>& messages,
                                      const CancelTokenPtr& cancel,
                                      const UnitSink& on_unit,
                                      const FrameSink& on_frame) {
    ResponseOutcome outcome;
    auto start = Clock::now();

    SynthesisScheduler scheduler(synthesizer_, config_.scheduler, cancel, on_frame);
    ResponseStreamer streamer(config_.max_unit_chars);
    bool synthesis_halted = false;

    auto dispatch = [&](const ResponseUnit& unit) {
        if (on_unit && !unit.text.empty()) on_unit(unit);
        std::string spoken = text::clean(unit.text);
        if (!scheduler.submit(unit.sequence, std::move(spoken))) {
            synthesis_halted = true;
            return false;
        }
        outcome.units++;
        return true;
    };

    auto reply = agent_->stream_chat(messages, [&](const std::string& delta) {
        outcome.text += delta;
        for (const auto& unit : streamer.feed(delta)) {
            if (!dispatch(unit)) return false;
        }
        return true;
    }, *cancel);

    if (reply.failed()) {
        if (synthesis_halted) {
            // The stream was stopped from our side; report why
            outcome.status = scheduler.finish();
            if (outcome.status.ok()) {
                outcome.status = VoidResult::failure(reply.to_error());
            }
        } else {
            scheduler.cancel();
            outcome.status = VoidResult::failure(reply.to_error());
        }
        LOG_LLM("Response aborted after " + std::to_string(outcome.units) + " units: " +
                outcome.status.error);
        return outcome;
    }

    // The backend may substitute text it never streamed (fallback reply)
    if (outcome.text.empty() && !reply.value->empty()) {
        outcome.text = *reply.value;
        for (const auto& unit : streamer.feed(outcome.text)) {
            if (!dispatch(unit)) break;
        }
    }

    if (!synthesis_halted) {
        dispatch(streamer.finish());
    }
    outcome.status = scheduler.finish();

    if (outcome.status.ok()) {
        LOG_TTS("Response delivered: " + std::to_string(outcome.units) + " units, " +
                std::to_string(scheduler.frames_released()) + " frames in " +
                std::to_string(ms_since(start)) + "ms");
    }
    return outcome;
}

} // namespace voice_relay
