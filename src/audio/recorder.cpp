#include "ptt_dictation/audio/recorder.hpp"

#include <SDL.h>

#include <future>
#include <string>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace ptt_dictation {

const char* recorder_errc_name(RecorderErrc code) {
    switch (code) {
        case RecorderErrc::DeviceUnavailable: return "DeviceUnavailable";
        case RecorderErrc::StreamSetupFailed: return "StreamSetupFailed";
        case RecorderErrc::CommandDeliveryFailed: return "CommandDeliveryFailed";
        case RecorderErrc::WorkerUnresponsive: return "WorkerUnresponsive";
        case RecorderErrc::ClipProcessingFailed: return "ClipProcessingFailed";
    }
    return "Unknown";
}

namespace {

// Body of the worker thread. The stream is opened, owned and released here;
// the outcome of opening it is reported through `ready`.
void capture_thread_main(std::shared_ptr<AudioBackend> backend,
                         RecorderSettings settings,
                         Receiver<Command> commands,
                         Sender<RecorderEvent> events,
                         std::promise<void> ready) {
    auto channel = make_channel<SampleBuffer>();
    Receiver<SampleBuffer> samples = std::move(channel.second);

    std::unique_ptr<InputStream> stream;
    try {
        StreamRequest request;
        request.device_id = settings.device_id;
        request.sample_rate = settings.worker.target_sample_rate;

        stream = backend->open_input(request, std::move(channel.first));
        stream->play();
    } catch (const std::exception&) {
        ready.set_exception(std::current_exception());
        return;
    }

    ready.set_value();

    // On failure the worker's receivers are dropped, so the handle sees a dead worker
    try {
        CaptureWorker worker(stream->config().sample_rate, settings.worker,
                             std::move(commands), std::move(samples), std::move(events));
        worker.run();
    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Capture worker failed: %s\n", e.what());
    }

    stream.reset();
}

} // namespace

Recorder::Recorder(std::shared_ptr<AudioBackend> backend, const RecorderSettings& settings)
    : backend_(std::move(backend)), settings_(settings) {
    if (!backend_) {
        throw std::invalid_argument("Recorder requires an audio backend");
    }
}

Recorder::~Recorder() {
    shutdown();
}

void Recorder::start() {
    if (!commands_) {
        spawn_worker();
    }

    if (!commands_.send(StartCommand{})) {
        throw RecorderError(RecorderErrc::CommandDeliveryFailed, "Failed to send Start command");
    }
    ++unconfirmed_starts_;
}

SampleBuffer Recorder::stop() {
    if (!commands_) {
        return SampleBuffer();
    }

    std::promise<SampleBuffer> reply;
    std::future<SampleBuffer> result = reply.get_future();

    if (!commands_.send(StopCommand{std::move(reply)})) {
        throw RecorderError(RecorderErrc::CommandDeliveryFailed, "Failed to send Stop command");
    }

    SampleBuffer clip;
    try {
        clip = result.get();
    } catch (const std::future_error& e) {
        throw RecorderError(RecorderErrc::WorkerUnresponsive,
                            std::string("Failed to receive samples: ") + e.what());
    } catch (const std::exception& e) {
        discard_events();
        throw RecorderError(RecorderErrc::ClipProcessingFailed, e.what());
    }

    discard_events();
    return clip;
}

bool Recorder::poll_event(RecorderEvent& event) {
    if (!events_) return false;

    RecorderEvent next;
    while (events_.try_recv(next) == ChannelStatus::Ok) {
        if (next == RecorderEvent::RecordingStarted) {
            if (unconfirmed_starts_ > 0) --unconfirmed_starts_;
        } else if (unconfirmed_starts_ > 0) {
            // Raised by a session that a later start() already replaced
            continue;
        }
        event = next;
        return true;
    }
    return false;
}

// The reply to a Stop is sent after every event of the session it ends, and
// every earlier Start has been applied by then.
void Recorder::discard_events() {
    RecorderEvent stale;
    while (events_ && events_.try_recv(stale) == ChannelStatus::Ok) {
    }
    unconfirmed_starts_ = 0;
}

void Recorder::spawn_worker() {
    auto command_channel = make_channel<Command>();
    auto event_channel = make_channel<RecorderEvent>();

    std::promise<void> ready;
    std::future<void> ready_result = ready.get_future();

    std::thread worker;
    try {
        worker = std::thread(capture_thread_main, backend_, settings_,
                             std::move(command_channel.second), std::move(event_channel.first),
                             std::move(ready));
    } catch (const std::system_error& e) {
        throw RecorderError(RecorderErrc::StreamSetupFailed,
                            std::string("Couldn't start capture worker: ") + e.what());
    }

    try {
        ready_result.get();
    } catch (const RecorderError&) {
        worker.join();
        throw;
    } catch (const std::exception& e) {
        worker.join();
        throw RecorderError(RecorderErrc::StreamSetupFailed, e.what());
    }

    commands_ = std::move(command_channel.first);
    events_ = std::move(event_channel.second);
    worker_ = std::move(worker);
}

void Recorder::shutdown() {
    if (commands_) {
        if (!commands_.send(ShutdownCommand{})) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Capture worker already gone at shutdown\n");
        }
        commands_ = Sender<Command>();
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    events_ = Receiver<RecorderEvent>();
}

} // namespace ptt_dictation
