#ifndef PTT_DICTATION_AUDIO_AUDIO_BACKEND_HPP
#define PTT_DICTATION_AUDIO_AUDIO_BACKEND_HPP

#include "ptt_dictation/audio/capture_config.hpp"
#include "ptt_dictation/audio/channel.hpp"

#include <memory>

namespace ptt_dictation {

struct StreamRequest {
    int device_id = -1;                    // -1 selects the default capture device
    int sample_rate = kTargetSampleRate;   // preferred rate, the device may pick another
};

// An open capture stream. Destroying it stops the device callback for good.
class InputStream {
public:
    virtual ~InputStream() = default;

    virtual void play() = 0;
    virtual const CaptureConfig& config() const = 0;
};

class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    /**
     * @brief Open a paused input stream.
     *
     * Mono chunks produced by the device callback are sent on @p samples.
     * Throws RecorderError: DeviceUnavailable when there is no capture device,
     * StreamSetupFailed when the device refuses every configuration.
     */
    virtual std::unique_ptr<InputStream> open_input(const StreamRequest& request,
                                                    Sender<SampleBuffer> samples) = 0;
};

} // namespace ptt_dictation

#endif // PTT_DICTATION_AUDIO_AUDIO_BACKEND_HPP
