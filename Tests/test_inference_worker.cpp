#include "InferenceWorker.hpp"
#include "TestSupport.hpp"

using namespace lt_test;

namespace {

/// Thread-safe record of what a worker emitted.
struct EventLog {
    std::vector<lt::WorkerEvent>    events;
    std::mutex                      mu;

    lt::EventHandler handler() {
        return [this](const lt::WorkerEvent& event) {
            std::lock_guard<std::mutex> lock(mu);
            events.push_back(event);
        };
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mu);
        return events.size();
    }

    lt::WorkerEvent at(size_t i) {
        std::lock_guard<std::mutex> lock(mu);
        return events.at(i);
    }

    bool wait_size(size_t n) {
        return wait_for([&] { return size() >= n; });
    }
};

lt::ModelConfig small_en() {
    lt::ModelConfig config;
    config.model_identifier = "small-en";
    return config;
}

std::vector<float> samples() {
    return sine(1600, 16000);
}

}

int main() {
    // Transcribe before configure.
    {
        auto script = std::make_shared<EngineScript>();
        EventLog log;
        lt::ThreadedInferenceWorker worker(std::make_unique<ScriptedEngine>(script), log.handler());

        worker.post(lt::WorkerCommand::make_transcribe(samples(), 5));
        expect_true(log.wait_size(1), "Not configured", "no event");
        auto ev = log.at(0);
        expect_true(ev.kind == lt::EventKind::error, "Not configured", "expected error event");
        expect_true(ev.correlation_id && *ev.correlation_id == 5, "Not configured", "missing correlation id");
        expect_true(ev.message == "Pipeline not initialized", "Not configured", "message: " + ev.message);
        pass("Not configured");
    }

    // Configure, transcribe, error paths, ordering.
    {
        auto script = std::make_shared<EngineScript>();
        script->assets = {"encoder.bin", "decoder.bin"};
        EventLog log;
        lt::ThreadedInferenceWorker worker(std::make_unique<ScriptedEngine>(script), log.handler());

        worker.post(lt::WorkerCommand::make_configure(small_en()));
        expect_true(log.wait_size(3), "Configure", "expected 3 events");
        expect_true(log.at(0).kind == lt::EventKind::progress &&
                    log.at(0).progress.asset_name == "encoder.bin", "Configure", "first progress");
        expect_true(log.at(1).kind == lt::EventKind::progress &&
                    log.at(1).progress.asset_name == "decoder.bin", "Configure", "second progress");
        expect_true(log.at(2).kind == lt::EventKind::ready, "Configure", "missing ready");
        pass("Configure");

        script->push(EngineScript::Reply::text, "  hello world \n");
        worker.post(lt::WorkerCommand::make_transcribe(samples(), 1));
        expect_true(log.wait_size(4), "Transcribe", "no result");
        auto done = log.at(3);
        expect_true(done.kind == lt::EventKind::transcription_complete, "Transcribe", "expected completion");
        expect_true(done.correlation_id && *done.correlation_id == 1, "Transcribe", "wrong id");
        expect_true(done.text == "hello world", "Transcribe", "text not trimmed: '" + done.text + "'");
        pass("Transcribe");

        script->push(EngineScript::Reply::text, " \t\n");
        worker.post(lt::WorkerCommand::make_transcribe(samples(), 2));
        expect_true(log.wait_size(5), "No text", "no result");
        auto empty = log.at(4);
        expect_true(empty.kind == lt::EventKind::error && empty.code == lt::ErrorCode::NoTextProduced,
                    "No text", "expected NoTextProduced");
        expect_true(empty.correlation_id && *empty.correlation_id == 2, "No text", "wrong id");
        pass("No text");

        script->push(EngineScript::Reply::throw_std, "decoder exploded");
        worker.post(lt::WorkerCommand::make_transcribe(samples(), 3));
        expect_true(log.wait_size(6), "Engine error", "no result");
        auto failed = log.at(5);
        expect_true(failed.kind == lt::EventKind::error && failed.code == lt::ErrorCode::InferenceFailed,
                    "Engine error", "expected InferenceFailed");
        expect_true(failed.message == "decoder exploded", "Engine error", "message: " + failed.message);
        expect_true(worker.is_alive(), "Engine error", "worker died on a recoverable error");
        pass("Engine error");

        script->push(EngineScript::Reply::text, "ten");
        script->push(EngineScript::Reply::text, "eleven");
        script->push(EngineScript::Reply::text, "twelve");
        for (uint64_t id = 10; id <= 12; ++id) {
            worker.post(lt::WorkerCommand::make_transcribe(samples(), id));
        }
        expect_true(log.wait_size(9), "Queue order", "missing results");
        for (uint64_t i = 0; i < 3; ++i) {
            auto ev = log.at(6 + i);
            expect_true(ev.correlation_id && *ev.correlation_id == 10 + i, "Queue order", "out of order");
        }
        pass("Queue order");
    }

    // Load failure.
    {
        auto script = std::make_shared<EngineScript>();
        script->load_error = "Model file not found";
        EventLog log;
        lt::ThreadedInferenceWorker worker(std::make_unique<ScriptedEngine>(script), log.handler());

        worker.post(lt::WorkerCommand::make_configure(small_en()));
        expect_true(log.wait_size(1), "Load failure", "no event");
        auto ev = log.at(0);
        expect_true(ev.kind == lt::EventKind::error && !ev.correlation_id, "Load failure", "expected configure error");
        expect_true(ev.message == "Model file not found", "Load failure", "message: " + ev.message);

        worker.post(lt::WorkerCommand::make_transcribe(samples(), 1));
        expect_true(log.wait_size(2), "Load failure", "no transcribe event");
        expect_true(log.at(1).message == "Pipeline not initialized", "Load failure", "transcribe ran unconfigured");
        pass("Load failure");
    }

    // Crash.
    {
        auto script = std::make_shared<EngineScript>();
        EventLog log;
        lt::ThreadedInferenceWorker worker(std::make_unique<ScriptedEngine>(script), log.handler());

        worker.post(lt::WorkerCommand::make_configure(small_en()));
        script->push(EngineScript::Reply::throw_other);
        worker.post(lt::WorkerCommand::make_transcribe(samples(), 1));
        expect_true(log.wait_size(2), "Crash", "no terminated event");
        expect_true(log.at(1).kind == lt::EventKind::terminated, "Crash", "expected terminated");
        expect_true(wait_for([&] { return !worker.is_alive(); }), "Crash", "worker still alive");

        worker.post(lt::WorkerCommand::make_transcribe(samples(), 2));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        expect_true(log.size() == 2, "Crash", "dead worker emitted an event");
        pass("Crash");
    }

    // A throwing event handler does not take the worker down.
    {
        auto script = std::make_shared<EngineScript>();
        script->assets = {"encoder.bin"};
        EventLog log;
        auto record = log.handler();
        lt::ThreadedInferenceWorker worker(std::make_unique<ScriptedEngine>(script),
            [&record](const lt::WorkerEvent& event) {
                record(event);
                if (event.kind == lt::EventKind::progress ||
                    event.kind == lt::EventKind::transcription_complete) {
                    throw std::runtime_error("handler failed");
                }
            });

        worker.post(lt::WorkerCommand::make_configure(small_en()));
        expect_true(log.wait_size(2), "Throwing handler", "configure did not finish");
        expect_true(log.at(1).kind == lt::EventKind::ready, "Throwing handler",
                    "progress handler failure broke the load");

        script->push(EngineScript::Reply::text, "first");
        script->push(EngineScript::Reply::text, "second");
        worker.post(lt::WorkerCommand::make_transcribe(samples(), 1));
        worker.post(lt::WorkerCommand::make_transcribe(samples(), 2));
        expect_true(log.wait_size(4), "Throwing handler", "missing results");
        for (size_t i = 2; i < 4; ++i) {
            expect_true(log.at(i).kind == lt::EventKind::transcription_complete, "Throwing handler",
                        std::string("unexpected ") + lt::event_kind_to_string(log.at(i).kind));
        }
        expect_true(log.at(3).text == "second", "Throwing handler", "text: " + log.at(3).text);
        expect_true(worker.is_alive(), "Throwing handler", "worker died");
        pass("Throwing handler");
    }

    // Terminate aborts a running inference.
    {
        auto script = std::make_shared<EngineScript>();
        EventLog log;
        lt::ThreadedInferenceWorker worker(std::make_unique<ScriptedEngine>(script), log.handler());

        worker.post(lt::WorkerCommand::make_configure(small_en()));
        expect_true(log.wait_size(1), "Terminate", "not configured");
        script->push(EngineScript::Reply::block_until_abort);
        worker.post(lt::WorkerCommand::make_transcribe(samples(), 1));
        worker.post(lt::WorkerCommand::make_transcribe(samples(), 2));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        auto started = std::chrono::steady_clock::now();
        worker.terminate();
        expect_true(std::chrono::steady_clock::now() - started < std::chrono::seconds(2),
                    "Terminate", "terminate did not return promptly");
        expect_true(script->aborted.load(), "Terminate", "engine abort not requested");
        expect_true(!worker.is_alive(), "Terminate", "worker still alive");
        expect_true(log.size() == 1, "Terminate", "events emitted after terminate");
        pass("Terminate");
    }

    std::cout << "All tests passed." << std::endl;
    return 0;
}
