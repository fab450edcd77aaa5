#include "FfmpegAudioStream.hpp"
#include "Logger.hpp"
#include "ModelManager.hpp"
#include "Settings.hpp"
#include "TranscriptionService.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace lt;

static std::atomic_bool g_running(true);

static void signal_handler(int) {
    g_running = false;
}

static constexpr const char* kLogSource = "livetranscribe";

int main(int argc, char** argv) {
    Settings settings;
    try {
        if (!settings.parse_args(argc, argv)) {
            fprintf(stdout, "%s", Settings::usage());
            return 0;
        }
    } catch (const std::invalid_argument& e) {
        fprintf(stderr, "error: %s\n\n%s", e.what(), Settings::usage());
        return 1;
    }

    Logger& log = Logger::instance();
    log.set_level(settings.log_level);
    log.capture_library_logs();

    for (const auto& adjustment : settings.validate()) {
        log.warn(kLogSource, adjustment);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // 1. Model
    WhisperEngineOptions engine_options;
    engine_options.model_dir = settings.model_dir;
    engine_options.n_threads = settings.n_threads;
    engine_options.use_gpu   = settings.use_gpu;

    ModelManager& manager = ModelManager::instance();
    manager.set_worker_factory(ModelManager::whisper_worker_factory(engine_options));
    manager.set_timeout(std::chrono::milliseconds(settings.transcription_timeout_ms));

    int last_decile = -1;
    auto unsubscribe = manager.subscribe([&](const ModelState& state) {
        for (const auto& item : state.progress) {
            int decile = static_cast<int>(item.percent) / 10;
            if (decile != last_decile) {
                last_decile = decile;
                log.info(kLogSource, "Loading " + item.asset_name + ": " +
                         std::to_string(decile * 10) + "%");
            }
        }
    });

    manager.load(settings.model_config());
    while (g_running && !manager.wait_until_settled(std::chrono::milliseconds(200))) {
    }
    unsubscribe();

    if (!manager.is_ready()) {
        std::string reason = manager.error().value_or("interrupted");
        log.error(kLogSource, "Model failed to load: " + reason);
        manager.unload();
        return 1;
    }

    // 2. Input
    std::shared_ptr<AudioStream> stream;
    try {
        stream = std::make_shared<FfmpegAudioStream>(settings.input_format, settings.input, settings.realtime);
    } catch (const TranscriptionError& e) {
        log.error(kLogSource, e.what());
        manager.unload();
        return 1;
    }

    // 3. Transcribe until interrupted or the input runs dry.
    std::mutex out_mu;
    TranscriptionService service(manager, settings);
    service.start(stream, [&](const ChunkResult& result) {
        std::lock_guard<std::mutex> lock(out_mu);
        const auto id = static_cast<unsigned long long>(result.chunk.correlation_id);
        if (result.ok()) {
            fprintf(stdout, "[%llu] %s\n", id, result.chunk.text.c_str());
        } else if (result.error == ErrorCode::NoAudioSource) {
            log.info(kLogSource, "Input ended: " + result.error_message);
        } else {
            fprintf(stdout, "[%llu] error: %s\n", id, result.error_message.c_str());
        }
        fflush(stdout);
    });

    while (g_running && service.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    while (g_running && service.pending_count() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::string transcript = service.get_transcript();
    service.stop();

    {
        std::lock_guard<std::mutex> lock(out_mu);
        fprintf(stdout, "\n%s\n", transcript.c_str());
    }

    manager.unload();
    return 0;
}
