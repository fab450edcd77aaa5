#include "Logger.hpp"
#include "ModelManager.hpp"
#include "TestSupport.hpp"

#include <future>

using namespace lt_test;
using std::chrono::milliseconds;

namespace {

lt::ModelConfig small_en() {
    lt::ModelConfig config;
    config.model_identifier = "small-en";
    return config;
}

lt::ProgressItem progress(const std::string& asset, float percent) {
    lt::ProgressItem item;
    item.asset_name = asset;
    item.percent = percent;
    item.bytes_total = 1000;
    item.bytes_loaded = static_cast<uint64_t>(percent * 10);
    return item;
}

/// Error code held by a settled future, or nullopt if it resolved.
std::optional<lt::ErrorCode> error_of(std::future<std::string>& future) {
    if (future.wait_for(milliseconds(3000)) != std::future_status::ready) {
        fail("future", "did not settle");
    }
    try {
        future.get();
    } catch (const lt::TranscriptionError& e) {
        return e.code();
    }
    return std::nullopt;
}

bool is_pending(std::future<std::string>& future) {
    return future.wait_for(milliseconds(0)) != std::future_status::ready;
}

/// Bring a manager to loaded through its newest scripted worker.
void make_ready(lt::ModelManager& manager, ScriptedWorkerPool& pool) {
    manager.load(small_en());
    pool.last()->deliver(lt::WorkerEvent::make_ready());
    if (!manager.is_ready()) fail("make_ready", "manager not loaded");
}

}

int main() {
    const auto wav = make_wav_segment();

    // Transcribe while unloaded.
    {
        ScriptedWorkerPool pool;
        lt::ModelManager manager(pool.factory());
        expect_true(manager.state().status == lt::ModelStatus::unloaded, "Not loaded", "initial status");

        auto future = manager.transcribe(wav, 1);
        expect_true(error_of(future) == lt::ErrorCode::ModelNotLoaded, "Not loaded", "expected ModelNotLoaded");
        expect_true(pool.size() == 0, "Not loaded", "worker was contacted");
        pass("Not loaded");
    }

    // Load with progress for two assets.
    {
        ScriptedWorkerPool pool;
        lt::ModelManager manager(pool.factory());

        std::vector<lt::ModelState> seen;
        std::mutex seen_mu;
        auto unsubscribe = manager.subscribe([&](const lt::ModelState& state) {
            std::lock_guard<std::mutex> lock(seen_mu);
            seen.push_back(state);
        });

        std::vector<std::string> messages;
        std::mutex messages_mu;
        lt::Logger::instance().set_sink([&](const lt::LogEntry& entry) {
            std::lock_guard<std::mutex> lock(messages_mu);
            if (entry.source == "ModelManager") messages.push_back(entry.message);
        });
        manager.load(small_en());
        lt::Logger::instance().set_sink(nullptr);
        {
            std::lock_guard<std::mutex> lock(messages_mu);
            expect_true(std::find(messages.begin(), messages.end(), "Loading model 'small-en' for transcribe") !=
                        messages.end(), "Load", "load not logged with its task");
        }
        expect_true(pool.size() == 1, "Load", "no worker spawned");
        auto channel = pool.at(0);
        expect_true(channel->command_count() == 1 &&
                    channel->command(0).kind == lt::CommandKind::configure, "Load", "configure not posted");
        expect_true(channel->command(0).config == small_en(), "Load", "wrong config posted");
        expect_true(manager.is_loading(), "Load", "not loading");
        expect_true(manager.current_config() && manager.current_config()->model_identifier == "small-en",
                    "Load", "config missing while loading");

        channel->deliver(lt::WorkerEvent::make_progress(progress("encoder", 10)));
        channel->deliver(lt::WorkerEvent::make_progress(progress("decoder", 5)));
        channel->deliver(lt::WorkerEvent::make_progress(progress("encoder", 60)));
        auto loading = manager.state();
        expect_true(loading.progress.size() == 2, "Load", "progress size " + std::to_string(loading.progress.size()));
        expect_true(loading.progress[0].asset_name == "encoder" && loading.progress[0].percent == 60.0f,
                    "Load", "encoder progress not upserted");

        channel->deliver(lt::WorkerEvent::make_ready());
        auto loaded = manager.state();
        expect_true(loaded.status == lt::ModelStatus::loaded, "Load", "not loaded after ready");
        expect_true(loaded.progress.empty(), "Load", "progress not cleared");
        expect_true(!loaded.error, "Load", "unexpected error");

        std::lock_guard<std::mutex> lock(seen_mu);
        expect_true(seen.size() == 5, "Load", "expected 5 notifications, got " + std::to_string(seen.size()));
        expect_true(seen.front().status == lt::ModelStatus::loading, "Load", "first notification not loading");
        expect_true(seen.back().status == lt::ModelStatus::loaded, "Load", "last notification not loaded");
        unsubscribe();
        pass("Load");

        // Progress after ready is ignored.
        channel->deliver(lt::WorkerEvent::make_progress(progress("late", 1)));
        expect_true(manager.state().progress.empty(), "Load", "late progress recorded");
        expect_true(manager.wait_until_settled(milliseconds(10)), "Load", "wait_until_settled timed out");
    }

    // Load while loading or loaded.
    {
        ScriptedWorkerPool pool;
        lt::ModelManager manager(pool.factory());
        manager.load(small_en());

        bool threw = false;
        try {
            manager.load(small_en());
        } catch (const lt::TranscriptionError& e) {
            threw = e.code() == lt::ErrorCode::AlreadyLoadingOrLoaded;
        }
        expect_true(threw, "Already loading", "second load accepted");
        expect_true(pool.at(0)->command_count() == 1, "Already loading", "worker contacted twice");
        pass("Already loading");
    }

    // Decode failure, success, duplicate and unknown ids.
    {
        ScriptedWorkerPool pool;
        lt::ModelManager manager(pool.factory());
        make_ready(manager, pool);
        auto channel = pool.at(0);

        std::vector<uint8_t> garbage(64, 0x11);
        auto bad = manager.transcribe(garbage, 1);
        expect_true(error_of(bad) == lt::ErrorCode::AudioDecodeError, "Decode failure", "expected AudioDecodeError");
        expect_true(channel->transcribe_count() == 0, "Decode failure", "worker contacted");
        expect_true(manager.pending_count() == 0, "Decode failure", "pending entry left behind");
        pass("Decode failure");

        auto good = manager.transcribe(wav, 2);
        expect_true(channel->transcribe_count() == 1, "Round trip", "transcribe not posted");
        auto cmd = channel->command(1);
        expect_true(cmd.correlation_id == 2 && !cmd.samples.empty(), "Round trip", "bad transcribe command");
        expect_true(manager.pending_count() == 1, "Round trip", "not pending");
        channel->deliver(lt::WorkerEvent::make_complete(2, "hello"));
        expect_true(!error_of(good), "Round trip", "rejected");
        expect_true(manager.pending_count() == 0, "Round trip", "still pending");
        pass("Round trip");

        channel->deliver(lt::WorkerEvent::make_complete(2, "again"));
        channel->deliver(lt::WorkerEvent::make_error(lt::ErrorCode::InferenceFailed, "late", uint64_t{99}));
        expect_true(manager.state().status == lt::ModelStatus::loaded, "Unknown id", "state changed");
        pass("Unknown id");

        auto first = manager.transcribe(wav, 7);
        bool threw = false;
        try {
            manager.transcribe(wav, 7);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect_true(threw, "Duplicate id", "duplicate registration accepted");
        channel->deliver(lt::WorkerEvent::make_error(lt::ErrorCode::NoTextProduced, "No text transcribed", uint64_t{7}));
        expect_true(error_of(first) == lt::ErrorCode::NoTextProduced, "Duplicate id", "worker error not forwarded");
        pass("Duplicate id");
    }

    // Timeout, then a late result.
    {
        ScriptedWorkerPool pool;
        lt::ModelManager manager(pool.factory(), milliseconds(100));
        make_ready(manager, pool);

        auto future = manager.transcribe(wav, 1);
        expect_true(error_of(future) == lt::ErrorCode::TranscriptionTimeout, "Timeout", "expected timeout");
        expect_true(manager.pending_count() == 0, "Timeout", "entry not removed");

        pool.at(0)->deliver(lt::WorkerEvent::make_complete(1, "too late"));
        expect_true(manager.state().status == lt::ModelStatus::loaded, "Timeout", "late result changed state");
        pass("Timeout");
    }

    // Throwing consumer callbacks are contained.
    {
        ScriptedWorkerPool pool;
        lt::ModelManager manager(pool.factory(), milliseconds(200));
        auto unsubscribe = manager.subscribe([](const lt::ModelState&) {
            throw std::runtime_error("listener failed");
        });
        make_ready(manager, pool);
        auto channel = pool.at(0);

        std::atomic<bool> resolved{false};
        manager.transcribe(wav, 1,
            [&resolved](const std::string&) {
                resolved.store(true);
                throw std::runtime_error("resolve failed");
            },
            [](const lt::TranscriptionError&) {});
        channel->deliver(lt::WorkerEvent::make_complete(1, "hello"));
        expect_true(resolved.load(), "Throwing callbacks", "resolve not called");
        expect_true(manager.is_ready() && manager.pending_count() == 0, "Throwing callbacks",
                    "resolve failure disturbed the manager");

        // Rejected on the timeout thread.
        std::atomic<bool> rejected{false};
        manager.transcribe(wav, 2,
            [](const std::string&) {},
            [&rejected](const lt::TranscriptionError& error) {
                rejected.store(error.code() == lt::ErrorCode::TranscriptionTimeout);
                throw std::runtime_error("reject failed");
            });
        expect_true(wait_for([&] { return rejected.load(); }), "Throwing callbacks", "timeout reject not called");
        expect_true(manager.pending_count() == 0, "Throwing callbacks", "entry not removed");

        // The timeout thread is still serving.
        auto after = manager.transcribe(wav, 3);
        expect_true(error_of(after) == lt::ErrorCode::TranscriptionTimeout, "Throwing callbacks",
                    "timeout thread stopped after a throwing reject");
        expect_true(manager.is_ready(), "Throwing callbacks", "state changed");
        unsubscribe();
        pass("Throwing callbacks");
    }

    // Unload rejects pending, then load again.
    {
        ScriptedWorkerPool pool;
        lt::ModelManager manager(pool.factory());
        make_ready(manager, pool);
        auto old_channel = pool.at(0);

        auto a = manager.transcribe(wav, 1);
        auto b = manager.transcribe(wav, 2);
        manager.unload();
        expect_true(error_of(a) == lt::ErrorCode::ModelUnloaded, "Unload", "first not rejected");
        expect_true(error_of(b) == lt::ErrorCode::ModelUnloaded, "Unload", "second not rejected");
        expect_true(old_channel->terminated.load(), "Unload", "worker not terminated");
        auto state = manager.state();
        expect_true(state.status == lt::ModelStatus::unloaded && !state.config, "Unload", "state not reset");

        manager.unload();   // no-op
        pass("Unload");

        manager.load(small_en());
        expect_true(pool.size() == 2, "Reload", "no new worker spawned");
        expect_true(manager.is_loading() && manager.pending_count() == 0, "Reload", "not a clean load");

        // Anything the retired worker says is ignored.
        old_channel->deliver(lt::WorkerEvent::make_ready());
        old_channel->deliver(lt::WorkerEvent::make_complete(1, "ghost"));
        expect_true(manager.is_loading(), "Reload", "stale ready accepted");

        pool.at(1)->deliver(lt::WorkerEvent::make_ready());
        expect_true(manager.is_ready(), "Reload", "not loaded");

        // The new worker reuses id 1; the retired worker cannot settle it.
        auto fresh = manager.transcribe(wav, 1);
        old_channel->deliver(lt::WorkerEvent::make_complete(1, "ghost"));
        expect_true(is_pending(fresh) && manager.pending_count() == 1, "Reload",
                    "retired worker settled a new transcription");
        pool.at(1)->deliver(lt::WorkerEvent::make_complete(1, "fresh"));
        expect_true(fresh.get() == "fresh", "Reload", "wrong result for reused id");
        pass("Reload");
    }

    // Worker crash.
    {
        ScriptedWorkerPool pool;
        lt::ModelManager manager(pool.factory());
        make_ready(manager, pool);
        auto channel = pool.at(0);

        auto future = manager.transcribe(wav, 3);
        channel->alive.store(false);
        channel->deliver(lt::WorkerEvent::make_terminated("segfault in decoder"));

        expect_true(error_of(future) == lt::ErrorCode::WorkerFailure, "Crash", "expected WorkerFailure");
        expect_true(manager.has_error(), "Crash", "state not error");
        expect_true(manager.error() && *manager.error() == "Worker error: segfault in decoder",
                    "Crash", "error message");

        auto after = manager.transcribe(wav, 4);
        expect_true(error_of(after) == lt::ErrorCode::ModelNotLoaded, "Crash", "transcribe accepted in error state");

        manager.load(small_en());
        expect_true(pool.size() == 2, "Crash", "dead worker reused");
        pass("Crash");
    }

    // Configure error, then retry on the same worker.
    {
        ScriptedWorkerPool pool;
        lt::ModelManager manager(pool.factory());
        manager.load(small_en());
        auto channel = pool.at(0);
        channel->deliver(lt::WorkerEvent::make_progress(progress("model", 30)));
        channel->deliver(lt::WorkerEvent::make_error(lt::ErrorCode::InferenceFailed, "Model file not found"));

        auto state = manager.state();
        expect_true(state.status == lt::ModelStatus::error, "Configure error", "status not error");
        expect_true(state.error && *state.error == "Model file not found", "Configure error", "message");
        expect_true(state.config.has_value(), "Configure error", "config dropped");
        expect_true(state.progress.empty(), "Configure error", "progress kept");

        manager.load(small_en());
        expect_true(pool.size() == 1 && channel->command_count() == 2, "Configure error", "worker not reused");
        expect_true(manager.is_loading() && !manager.error(), "Configure error", "error not cleared");
        pass("Configure error");
    }

    std::cout << "All tests passed." << std::endl;
    return 0;
}
