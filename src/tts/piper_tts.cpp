/**
 * @file piper_tts.cpp
 * @brief Piper TTS implementation
 */

#include "tts/piper_tts.h"
#include "audio/pcm.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <mutex>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using json = nlohmann::json;

namespace voice_relay {
namespace tts {

namespace {

constexpr int POLL_INTERVAL_MS = 50;
constexpr size_t READ_CHUNK_BYTES = 8192;

bool is_executable(const std::string& path) {
    return !path.empty() && access(path.c_str(), X_OK) == 0;
}

} // anonymous namespace

int read_voice_sample_rate(const std::string& voice_path) {
    std::ifstream file(voice_path + ".json");
    if (!file.good()) {
        return constants::tts::PIPER_DEFAULT_SAMPLE_RATE;
    }
    try {
        json voice = json::parse(file);
        if (voice.contains("audio") && voice["audio"].contains("sample_rate")) {
            return voice["audio"]["sample_rate"].get<int>();
        }
    } catch (const json::exception& e) {
        LOG_TTS("Unreadable voice config " + voice_path + ".json: " + e.what());
    }
    return constants::tts::PIPER_DEFAULT_SAMPLE_RATE;
}

/**
 * @brief Implementation details for PiperTTS
 */
class PiperTTS::Impl {
public:
    explicit Impl(const config::TTSConfig& config)
        : config_(config)
        , sample_rate_(read_voice_sample_rate(config.voice_path)) {
        std::ostringstream oss;
        oss << "PiperTTS initialized: voice=" << config.voice_path
            << ", rate=" << sample_rate_ << "Hz"
            << ", gain=" << config.output_gain;
        LOG_TTS(oss.str());
    }

    VoidResult warmup() {
        LOG_TTS("Warming up TTS engine...");

        auto result = find_piper();
        if (result.failed()) {
            return result;
        }

        std::ifstream voice_file(config_.voice_path);
        if (!voice_file.good()) {
            return VoidResult::failure("Voice model not found: " + config_.voice_path, ErrorType::IOError);
        }

        ready_ = true;
        LOG_TTS("TTS warmup complete");
        return VoidResult::ok_result();
    }

    VoidResult synthesize(const std::string& text, const FrameCallback& on_frame, const CancelToken& cancel) {
        auto find_result = find_piper();
        if (find_result.failed()) {
            return find_result;
        }

        auto start_time = Clock::now();

        int in_pipe[2];
        int out_pipe[2];
        // Close-on-exec so concurrent children never hold each other's ends;
        // dup2 clears the flag on the child's stdin and stdout
        if (pipe2(in_pipe, O_CLOEXEC) != 0) {
            return VoidResult::failure(std::string("pipe failed: ") + std::strerror(errno), ErrorType::ProviderError);
        }
        if (pipe2(out_pipe, O_CLOEXEC) != 0) {
            close(in_pipe[0]);
            close(in_pipe[1]);
            return VoidResult::failure(std::string("pipe failed: ") + std::strerror(errno), ErrorType::ProviderError);
        }

        std::vector<std::string> args = {
            piper_path(), "--model", config_.voice_path, "--output_raw", "--quiet"
        };
        if (!config_.espeak_data_path.empty()) {
            args.push_back("--espeak_data");
            args.push_back(config_.espeak_data_path);
        }
        std::vector<char*> argv;
        for (auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0) {
            close(in_pipe[0]); close(in_pipe[1]);
            close(out_pipe[0]); close(out_pipe[1]);
            return VoidResult::failure(std::string("fork failed: ") + std::strerror(errno), ErrorType::ProviderError);
        }

        if (pid == 0) {
            dup2(in_pipe[0], STDIN_FILENO);
            dup2(out_pipe[1], STDOUT_FILENO);
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) dup2(devnull, STDERR_FILENO);
            close(in_pipe[0]); close(in_pipe[1]);
            close(out_pipe[0]); close(out_pipe[1]);
            execv(argv[0], argv.data());
            _exit(127);
        }

        close(in_pipe[0]);
        close(out_pipe[1]);

        // Piper reads one utterance per line
        std::string line = text;
        for (auto& c : line) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        line.push_back('\n');
        bool write_ok = write_all(in_pipe[1], line);
        close(in_pipe[1]);

        VoidResult result = write_ok
            ? pump_output(out_pipe[0], pid, on_frame, cancel)
            : VoidResult::failure("Failed to write text to piper", ErrorType::ProviderError);
        close(out_pipe[0]);

        int status = 0;
        if (result.failed()) {
            kill(pid, SIGKILL);
        }
        waitpid(pid, &status, 0);

        if (result.ok() && (!WIFEXITED(status) || WEXITSTATUS(status) != 0)) {
            result = VoidResult::failure("Piper exited with status " + std::to_string(WEXITSTATUS(status)),
                                         ErrorType::ProviderError);
        }

        if (result.ok()) {
            LOG_TTS("Synthesized \"" + text + "\" in " + std::to_string(ms_since(start_time)) + "ms");
        } else if (result.kind != ErrorType::SessionCanceled) {
            LOG_TTS("Piper failed: " + result.error);
        }
        return result;
    }

    int sample_rate() const {
        return sample_rate_;
    }

    bool is_ready() const {
        return ready_;
    }

private:
    // =========================================================================
    // Piper Interaction
    // =========================================================================

    VoidResult find_piper() {
        std::lock_guard<std::mutex> lock(path_mutex_);
        if (!cached_piper_path_.empty()) {
            return VoidResult::ok_result();
        }

        if (!config_.piper_path.empty()) {
            if (is_executable(config_.piper_path)) {
                cached_piper_path_ = config_.piper_path;
                LOG_TTS("Using custom piper path: " + cached_piper_path_);
                return VoidResult::ok_result();
            }
            return VoidResult::failure("Custom piper path not found: " + config_.piper_path, ErrorType::IOError);
        }

        std::vector<std::string> search_paths = {
            "/usr/local/bin/piper",
            "/opt/homebrew/bin/piper",
            "/usr/bin/piper"
        };

        // PATH entries after the well-known locations
        if (const char* path_env = std::getenv("PATH")) {
            std::istringstream dirs(path_env);
            std::string dir;
            while (std::getline(dirs, dir, ':')) {
                if (!dir.empty()) search_paths.push_back(dir + "/piper");
            }
        }

        for (const auto& path : search_paths) {
            if (is_executable(path)) {
                cached_piper_path_ = path;
                LOG_TTS("Found piper at: " + cached_piper_path_);
                return VoidResult::ok_result();
            }
        }

        return VoidResult::failure("Piper binary not found. Install piper or set tts.piper_path in config.",
                                   ErrorType::IOError);
    }

    std::string piper_path() {
        std::lock_guard<std::mutex> lock(path_mutex_);
        return cached_piper_path_;
    }

    static bool write_all(int fd, const std::string& data) {
        size_t offset = 0;
        while (offset < data.size()) {
            ssize_t n = write(fd, data.data() + offset, data.size() - offset);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            offset += static_cast<size_t>(n);
        }
        return true;
    }

    VoidResult pump_output(int fd, pid_t pid, const FrameCallback& on_frame, const CancelToken& cancel) {
        std::vector<uint8_t> carry;
        std::vector<uint8_t> buffer(READ_CHUNK_BYTES);
        size_t total_samples = 0;

        for (;;) {
            if (cancel.is_canceled()) {
                kill(pid, SIGKILL);
                return VoidResult::failure(make_canceled_error());
            }

            struct pollfd pfd = {fd, POLLIN, 0};
            int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
            if (ready < 0) {
                if (errno == EINTR) continue;
                return VoidResult::failure(std::string("poll failed: ") + std::strerror(errno),
                                           ErrorType::ProviderError);
            }
            if (ready == 0) continue;

            ssize_t n = read(fd, buffer.data(), buffer.size());
            if (n < 0) {
                if (errno == EINTR) continue;
                return VoidResult::failure(std::string("read failed: ") + std::strerror(errno),
                                           ErrorType::ProviderError);
            }
            if (n == 0) break;  // EOF

            carry.insert(carry.end(), buffer.begin(), buffer.begin() + n);
            const size_t usable = carry.size() & ~static_cast<size_t>(1);
            if (usable == 0) continue;

            Pcm16Buffer pcm = pcm::pcm16_from_le_bytes(carry.data(), usable);
            carry.erase(carry.begin(), carry.begin() + static_cast<std::ptrdiff_t>(usable));

            pcm::apply_gain(pcm, config_.output_gain);
            total_samples += pcm.size();
            if (on_frame) on_frame(std::move(pcm));
        }

        if (total_samples == 0) {
            return VoidResult::failure("Piper produced no audio", ErrorType::ProviderError);
        }
        return VoidResult::ok_result();
    }

    // =========================================================================
    // Member Variables
    // =========================================================================

    config::TTSConfig config_;
    int sample_rate_;

    std::mutex path_mutex_;
    std::string cached_piper_path_;
    std::atomic<bool> ready_{false};
};

// =============================================================================
// Public Interface Implementation
// =============================================================================

PiperTTS::PiperTTS(const config::TTSConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

PiperTTS::~PiperTTS() = default;

VoidResult PiperTTS::synthesize(const std::string& text, const FrameCallback& on_frame, const CancelToken& cancel) {
    return impl_->synthesize(text, on_frame, cancel);
}

int PiperTTS::sample_rate() const {
    return impl_->sample_rate();
}

bool PiperTTS::is_ready() const {
    return impl_->is_ready();
}

VoidResult PiperTTS::warmup() {
    return impl_->warmup();
}

} // namespace tts
} // namespace voice_relay
