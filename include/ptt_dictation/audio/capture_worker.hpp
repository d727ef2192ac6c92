#ifndef PTT_DICTATION_AUDIO_CAPTURE_WORKER_HPP
#define PTT_DICTATION_AUDIO_CAPTURE_WORKER_HPP

#include "ptt_dictation/audio/capture_config.hpp"
#include "ptt_dictation/audio/channel.hpp"
#include "ptt_dictation/audio/silence_trimmer.hpp"

#include <chrono>
#include <cstddef>
#include <future>
#include <variant>

namespace ptt_dictation {

struct StartCommand {};

struct StopCommand {
    std::promise<SampleBuffer> reply;
};

struct ShutdownCommand {};

using Command = std::variant<StartCommand, StopCommand, ShutdownCommand>;

enum class RecorderEvent {
    RecordingStarted,  // a Start command took effect
    AutoStopped        // silence outlasted WorkerSettings::auto_stop_silence
};

struct WorkerSettings {
    int target_sample_rate = kTargetSampleRate;
    float silence_threshold = kDefaultSilenceThreshold;
    std::size_t trim_padding = kDefaultTrimPadding;
    std::chrono::milliseconds poll_interval{50};
    std::chrono::milliseconds auto_stop_silence{0};  // 0 disables AutoStopped
};

// Resample to the target rate, then trim leading and trailing silence
SampleBuffer finish_clip(SampleBuffer raw, int device_rate, const WorkerSettings& settings);

/**
 * @brief Recording state machine driven by a command inbox and a sample inbox.
 *
 * Owns every piece of mutable recording state and is only reachable through
 * its channels. run() loops until Shutdown or until either inbox disconnects.
 */
class CaptureWorker {
public:
    enum class State { Idle, Recording };

    CaptureWorker(int device_sample_rate,
                  const WorkerSettings& settings,
                  Receiver<Command> commands,
                  Receiver<SampleBuffer> samples,
                  Sender<RecorderEvent> events = Sender<RecorderEvent>());

    void run();

    // One loop iteration: at most one command, then wait up to the poll
    // interval for one chunk. Returns false once the worker has terminated.
    bool poll_once();

    State state() const { return state_; }
    std::size_t accumulated() const { return accumulator_.size(); }

private:
    bool apply(Command& command);
    void on_start();
    void on_stop(StopCommand& command);
    void on_chunk(SampleBuffer&& chunk);
    void emit(RecorderEvent event);

    int device_sample_rate_;
    WorkerSettings settings_;
    Receiver<Command> commands_;
    Receiver<SampleBuffer> samples_;
    Sender<RecorderEvent> events_;

    State state_ = State::Idle;
    bool terminated_ = false;
    SampleBuffer accumulator_;
    std::chrono::steady_clock::time_point session_start_;

    std::size_t silent_run_ = 0;       // consecutive quiet samples at device rate
    std::size_t auto_stop_samples_ = 0;
    bool auto_stop_sent_ = false;
};

} // namespace ptt_dictation

#endif // PTT_DICTATION_AUDIO_CAPTURE_WORKER_HPP
