#ifndef PTT_DICTATION_AUDIO_SDL_AUDIO_BACKEND_HPP
#define PTT_DICTATION_AUDIO_SDL_AUDIO_BACKEND_HPP

#include <SDL.h>
#include <SDL_audio.h>

#include "ptt_dictation/audio/audio_backend.hpp"
#include "ptt_dictation/audio/capture_callback.hpp"

#include <memory>

namespace ptt_dictation {

constexpr int kDefaultCaptureDevice = -1;

// Index of the capture device to open for a configured device id, or
// kDefaultCaptureDevice when the id is negative or out of range
int resolve_capture_device(int requested, int n_devices);

// Capture device opened through SDL2. Holds a reference on the SDL audio
// subsystem for its whole lifetime.
class SdlInputStream : public InputStream {
public:
    SdlInputStream();
    ~SdlInputStream() override;

    SdlInputStream(const SdlInputStream&) = delete;
    SdlInputStream& operator=(const SdlInputStream&) = delete;

    // Opens the device paused, falling back to the device's preferred spec
    // when the requested rate is refused
    void open(const StreamRequest& request, Sender<SampleBuffer> samples);

    void play() override;
    const CaptureConfig& config() const override { return config_; }

private:
    static void sdl_callback(void* userdata, uint8_t* stream, int len);

    SDL_AudioDeviceID device_ = 0;
    CaptureConfig config_;
    std::unique_ptr<CaptureCallback> callback_;
};

class SdlAudioBackend : public AudioBackend {
public:
    std::unique_ptr<InputStream> open_input(const StreamRequest& request,
                                            Sender<SampleBuffer> samples) override;
};

} // namespace ptt_dictation

#endif // PTT_DICTATION_AUDIO_SDL_AUDIO_BACKEND_HPP
