#ifndef PTT_DICTATION_AUDIO_RECORDER_HPP
#define PTT_DICTATION_AUDIO_RECORDER_HPP

#include "ptt_dictation/audio/audio_backend.hpp"
#include "ptt_dictation/audio/capture_worker.hpp"
#include "ptt_dictation/audio/recorder_error.hpp"

#include <memory>
#include <thread>

namespace ptt_dictation {

struct RecorderSettings {
    int device_id = -1;
    WorkerSettings worker;
};

/**
 * @brief Push-to-talk controller.
 *
 * The capture stream and its worker thread are created on the first start()
 * and live until the recorder is destroyed. Not thread-safe: drive one
 * Recorder from a single control thread.
 */
class Recorder {
public:
    explicit Recorder(std::shared_ptr<AudioBackend> backend,
                      const RecorderSettings& settings = RecorderSettings());
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    // Begins a new clip, discarding any clip in progress.
    // Throws RecorderError (DeviceUnavailable, StreamSetupFailed,
    // CommandDeliveryFailed).
    void start();

    // Ends the clip and returns it resampled and trimmed, possibly empty.
    // Blocks until the worker answers. Throws RecorderError
    // (CommandDeliveryFailed, WorkerUnresponsive, ClipProcessingFailed).
    // Events still queued from the finished session are discarded.
    SampleBuffer stop();

    // Non-blocking; true when an event was written to @p event. AutoStopped
    // is only reported for the most recent start().
    bool poll_event(RecorderEvent& event);

    bool started() const { return static_cast<bool>(commands_); }

private:
    void spawn_worker();
    void shutdown();
    void discard_events();

    std::shared_ptr<AudioBackend> backend_;
    RecorderSettings settings_;

    Sender<Command> commands_;
    Receiver<RecorderEvent> events_;
    int unconfirmed_starts_ = 0;  // Start commands not yet seen as RecordingStarted
    std::thread worker_;
};

} // namespace ptt_dictation

#endif // PTT_DICTATION_AUDIO_RECORDER_HPP
