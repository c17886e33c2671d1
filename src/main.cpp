#include "core/config.h"
#include "logger.h"
#include "providers.h"
#include "session.h"
#include "session_registry.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <signal.h>
#include <optional>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace voice_relay {

static std::atomic<bool> g_stop{false};

void signal_handler(int) {
    g_stop = true;
}

/**
 * @brief Client channel writing one JSON frame per line to stdout
 */
class StdoutChannel : public IClientChannel {
public:
    void send(const std::string& frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << frame << '\n';
        std::cout.flush();
    }

    void close(CloseCode code, const std::string& reason) override {
        Logger::info("Connection closed: " + std::to_string(static_cast<int>(code)) + " " + reason);
    }

private:
    std::mutex mutex_;
};

struct Options {
    std::string config_path;
    std::string replay_path;
    int chunk_ms = 100;
    bool realtime_pacing = false;
    std::optional<bool> continuous;
    std::string log_level;
};

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options]\n"
              << "  --config PATH       JSON configuration file\n"
              << "  --replay FILE       stream a raw float32 mono 16 kHz file through one turn\n"
              << "  --chunk-ms N        replay chunk length (default 100)\n"
              << "  --realtime          pace replay chunks in real time\n"
              << "  --continuous        re-arm listening after each response\n"
              << "  --log-level LEVEL   debug | info | warn | error\n"
              << "Without --replay, client frames are read from stdin, one JSON object per line.\n";
}

bool parse_options(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a value\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!next(opts.config_path)) return false;
        } else if (arg == "--replay") {
            if (!next(opts.replay_path)) return false;
        } else if (arg == "--chunk-ms") {
            std::string value;
            if (!next(value)) return false;
            opts.chunk_ms = std::atoi(value.c_str());
            if (opts.chunk_ms <= 0) {
                std::cerr << "--chunk-ms must be positive\n";
                return false;
            }
        } else if (arg == "--realtime") {
            opts.realtime_pacing = true;
        } else if (arg == "--continuous") {
            opts.continuous = true;
        } else if (arg == "--log-level") {
            if (!next(opts.log_level)) return false;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

/// Wait while a turn is being transcribed or answered
void wait_for_turn(const Session& session, std::chrono::seconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!g_stop && std::chrono::steady_clock::now() < deadline) {
        State state = session.state();
        if (state != State::Transcribing && state != State::Responding) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

int run_stdio(Session& session) {
    std::string line;
    while (!g_stop && std::getline(std::cin, line)) {
        utils::trim(line);
        if (line.empty()) continue;
        if (!session.post_client_frame(line)) break;
    }
    // Let the last turn play out before hanging up
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    wait_for_turn(session, std::chrono::seconds(120));
    return 0;
}

int run_replay(Session& session, const Options& opts, int sample_rate) {
    std::ifstream in(opts.replay_path, std::ios::binary);
    if (!in) {
        Logger::error("Cannot open replay file: " + opts.replay_path);
        return 1;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    bytes.resize(bytes.size() - bytes.size() % sizeof(float));
    if (bytes.empty()) {
        Logger::error("Replay file has no samples: " + opts.replay_path);
        return 1;
    }

    json start;
    start["type"] = "start_listening";
    if (opts.continuous) start["continuous"] = *opts.continuous;
    session.post_client_frame(start.dump());

    const size_t chunk_bytes = audio::ms_to_samples(opts.chunk_ms, sample_rate) * sizeof(float);
    for (size_t offset = 0; offset < bytes.size() && !g_stop; offset += chunk_bytes) {
        const size_t len = std::min(chunk_bytes, bytes.size() - offset);
        json frame;
        frame["type"] = "audio";
        frame["data"] = utils::base64_encode(bytes.data() + offset, len);
        session.post_client_frame(frame.dump());
        if (opts.realtime_pacing) {
            std::this_thread::sleep_for(std::chrono::milliseconds(opts.chunk_ms));
        }
    }

    // Ends the turn unless the detector already did
    json stop;
    stop["type"] = "stop_listening";
    session.post_client_frame(stop.dump());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    wait_for_turn(session, std::chrono::seconds(120));
    return 0;
}

} // namespace voice_relay

int main(int argc, char* argv[]) {
    using namespace voice_relay;

    Logger::initialize(LogLevel::INFO);

    Options opts;
    if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0)) {
        print_usage(argv[0]);
        return 0;
    }
    if (!parse_options(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }

    Config config = Config::defaults();
    if (!opts.config_path.empty()) {
        auto loaded = Config::load(opts.config_path);
        if (loaded.failed()) {
            Logger::error("Failed to load config: " + loaded.error);
            return 1;
        }
        config = *loaded.value;
    }
    config.apply_env_overrides([](const char* name) { return std::getenv(name); });
    if (opts.continuous) config.session.continuous = *opts.continuous;
    if (!opts.log_level.empty()) config.log.level = opts.log_level;

    std::string invalid = config.validate();
    if (!invalid.empty()) {
        Logger::error("Invalid configuration: " + invalid);
        return 1;
    }

    Logger::shutdown();
    if (!Logger::initialize(Logger::parse_level(config.log.level), config.log.file)) {
        Logger::warn("Logging to stderr only");
    }

    // A closed stdout must not kill the process mid-turn
    std::signal(SIGPIPE, SIG_IGN);

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART: interrupt the blocking stdin read
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    auto providers = build_providers(config);
    if (providers.failed()) {
        Logger::error("Provider setup failed: " + providers.error);
        Logger::shutdown();
        return 1;
    }

    SessionRegistry registry;
    auto session = std::make_shared<Session>("stdio-1", config, std::move(*providers.value),
                                             std::make_shared<StdoutChannel>());
    registry.insert(session);
    session->start();

    int result = opts.replay_path.empty()
        ? run_stdio(*session)
        : run_replay(*session, opts, config.audio.input_sample_rate);

    Logger::info("Shutting down...");
    registry.shutdown();

    Logger::shutdown();
    return result;
}
