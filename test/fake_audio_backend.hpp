#ifndef PTT_DICTATION_TEST_FAKE_AUDIO_BACKEND_HPP
#define PTT_DICTATION_TEST_FAKE_AUDIO_BACKEND_HPP

#include "ptt_dictation/audio/audio_backend.hpp"
#include "ptt_dictation/audio/capture_callback.hpp"
#include "ptt_dictation/audio/recorder_error.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace ptt_dictation {
namespace test {

// In-process stand-in for a capture device. deliver() plays the role of the
// device thread and pushes interleaved F32 frames through the real callback.
class FakeAudioBackend : public AudioBackend {
public:
    CaptureConfig config;
    bool has_device = true;
    bool fail_setup = false;
    bool fail_play = false;
    bool drop_sender = false;  // capture source vanishes right after opening

    std::atomic<int> open_count{0};
    std::atomic<int> close_count{0};

    std::unique_ptr<InputStream> open_input(const StreamRequest& request,
                                            Sender<SampleBuffer> samples) override {
        if (!has_device) {
            throw RecorderError(RecorderErrc::DeviceUnavailable, "No input device found");
        }
        if (fail_setup) {
            throw RecorderError(RecorderErrc::StreamSetupFailed, "Device rejected configuration");
        }
        last_request = request;
        ++open_count;

        std::unique_ptr<CaptureCallback> callback;
        Sender<SampleBuffer> tap;
        if (!drop_sender) {
            tap = samples;
            callback = std::make_unique<CaptureCallback>(config, std::move(samples));
        }
        return std::make_unique<Stream>(*this, std::move(callback), std::move(tap));
    }

    // Destroys the capture callback, and with it the last sample sender,
    // as if the device was unplugged mid-stream
    void disconnect() {
        std::unique_ptr<CaptureCallback> dropped;
        Sender<SampleBuffer> dropped_tap;
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = std::move(active_);
        dropped_tap = std::move(tap_);
    }

    // Chunks delivered but not yet taken by the worker
    std::size_t backlog() {
        std::lock_guard<std::mutex> lock(mutex_);
        return tap_.backlog();
    }

    // False when no stream is playing
    bool deliver(const std::vector<float>& interleaved) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || !playing_) return false;
        (*active_)(reinterpret_cast<const uint8_t*>(interleaved.data()),
                   static_cast<int>(interleaved.size() * sizeof(float)));
        return true;
    }

    bool playing() {
        std::lock_guard<std::mutex> lock(mutex_);
        return playing_;
    }

    StreamRequest last_request;

private:
    class Stream : public InputStream {
    public:
        Stream(FakeAudioBackend& owner, std::unique_ptr<CaptureCallback> callback,
               Sender<SampleBuffer> tap)
            : owner_(owner) {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.active_ = std::move(callback);
            owner_.tap_ = std::move(tap);
        }

        ~Stream() override {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.active_.reset();
            owner_.tap_ = Sender<SampleBuffer>();
            owner_.playing_ = false;
            ++owner_.close_count;
        }

        void play() override {
            if (owner_.fail_play) {
                throw RecorderError(RecorderErrc::StreamSetupFailed, "Capture device did not start");
            }
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.playing_ = true;
        }

        const CaptureConfig& config() const override { return owner_.config; }

    private:
        FakeAudioBackend& owner_;
    };

    std::mutex mutex_;
    std::unique_ptr<CaptureCallback> active_;
    Sender<SampleBuffer> tap_;  // observes the sample queue, dropped with the callback
    bool playing_ = false;
};

} // namespace test
} // namespace ptt_dictation

#endif // PTT_DICTATION_TEST_FAKE_AUDIO_BACKEND_HPP
