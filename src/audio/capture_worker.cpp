#include "ptt_dictation/audio/capture_worker.hpp"
#include "ptt_dictation/audio/resampler.hpp"

#include <SDL.h>

#include <exception>
#include <utility>

namespace ptt_dictation {

SampleBuffer finish_clip(SampleBuffer raw, int device_rate, const WorkerSettings& settings) {
    SampleBuffer clip = device_rate != settings.target_sample_rate
        ? resample_linear(raw, device_rate, settings.target_sample_rate)
        : std::move(raw);

    const size_t resampled = clip.size();
    trim_silence(clip, settings.silence_threshold, settings.trim_padding);

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Finished clip: %zu samples at %d Hz, %zu after trim\n",
                 resampled, settings.target_sample_rate, clip.size());
    return clip;
}

CaptureWorker::CaptureWorker(int device_sample_rate,
                             const WorkerSettings& settings,
                             Receiver<Command> commands,
                             Receiver<SampleBuffer> samples,
                             Sender<RecorderEvent> events)
    : device_sample_rate_(device_sample_rate),
      settings_(settings),
      commands_(std::move(commands)),
      samples_(std::move(samples)),
      events_(std::move(events)) {
    if (settings_.auto_stop_silence.count() > 0) {
        auto_stop_samples_ = static_cast<std::size_t>(
            static_cast<long long>(device_sample_rate_) * settings_.auto_stop_silence.count() / 1000);
    }
}

void CaptureWorker::run() {
    SDL_Log("Capture worker running: device %d Hz, target %d Hz\n",
            device_sample_rate_, settings_.target_sample_rate);

    while (poll_once()) {
    }

    SDL_Log("Capture worker exited\n");
}

bool CaptureWorker::poll_once() {
    if (terminated_) return false;

    // 1. At most one pending command
    Command command;
    switch (commands_.try_recv(command)) {
        case ChannelStatus::Ok:
            if (!apply(command)) {
                terminated_ = true;
                return false;
            }
            break;
        case ChannelStatus::Disconnected:
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Command channel closed, stopping worker\n");
            terminated_ = true;
            return false;
        default:
            break;
    }

    // 2. Next chunk from the device, bounded wait so commands stay responsive
    SampleBuffer chunk;
    switch (samples_.recv_for(chunk, settings_.poll_interval)) {
        case ChannelStatus::Ok:
            on_chunk(std::move(chunk));
            break;
        case ChannelStatus::Disconnected:
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Capture source disconnected, stopping worker\n");
            terminated_ = true;
            return false;
        default:
            break;
    }

    return true;
}

bool CaptureWorker::apply(Command& command) {
    if (std::holds_alternative<StartCommand>(command)) {
        on_start();
    } else if (auto* stop = std::get_if<StopCommand>(&command)) {
        on_stop(*stop);
    } else {
        SDL_Log("Capture worker shutting down\n");
        return false;
    }
    return true;
}

void CaptureWorker::on_start() {
    if (state_ == State::Recording) {
        SDL_Log("Recording restarted, discarding %zu samples\n", accumulator_.size());
    }
    accumulator_.clear();
    state_ = State::Recording;
    session_start_ = std::chrono::steady_clock::now();
    silent_run_ = 0;
    auto_stop_sent_ = false;
    SDL_Log("Recording started\n");
    emit(RecorderEvent::RecordingStarted);
}

void CaptureWorker::on_stop(StopCommand& command) {
    if (state_ == State::Idle) {
        command.reply.set_value(SampleBuffer());
        return;
    }

    state_ = State::Idle;
    SampleBuffer raw = std::move(accumulator_);
    accumulator_ = SampleBuffer();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session_start_);
    SDL_Log("Recording stopped after %lld ms, captured %zu samples\n",
            static_cast<long long>(elapsed.count()), raw.size());

    // Failures belong to the caller waiting on the reply, the worker keeps running
    try {
        command.reply.set_value(finish_clip(std::move(raw), device_sample_rate_, settings_));
    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Couldn't finish clip: %s\n", e.what());
        command.reply.set_exception(std::current_exception());
    }
}

void CaptureWorker::emit(RecorderEvent event) {
    if (events_ && !events_.send(event)) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "No listener for recorder events\n");
    }
}

void CaptureWorker::on_chunk(SampleBuffer&& chunk) {
    if (state_ != State::Recording) return;

    if (auto_stop_samples_ > 0 && !auto_stop_sent_) {
        if (peak_amplitude(chunk) > settings_.silence_threshold) {
            silent_run_ = 0;
        } else {
            silent_run_ += chunk.size();
            if (silent_run_ > auto_stop_samples_) {
                SDL_Log("Silence for more than %lld ms\n",
                        static_cast<long long>(settings_.auto_stop_silence.count()));
                auto_stop_sent_ = true;
                emit(RecorderEvent::AutoStopped);
            }
        }
    }

    accumulator_.insert(accumulator_.end(), chunk.begin(), chunk.end());
}

} // namespace ptt_dictation
